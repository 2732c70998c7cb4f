#include "execution/dispatcher/http_dispatcher.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>


namespace
{
	constexpr long HTTP_OK = 200;

	std::string build_execute_payload(const IDispatcher::DispatchRequest& request)
	{
		nlohmann::json payload;
		payload["job_id"] = request.job_id;

		const std::vector<uint8_t> data_array(std::begin(request.payload), std::end(request.payload));
		payload["payload"] = data_array;

		return payload.dump();
	}

	std::string build_abort_payload(job_id_t job_id)
	{
		nlohmann::json payload;
		payload["job_id"] = job_id;

		return payload.dump();
	}

	int trace([[maybe_unused]] CURL* curl_handle, curl_infotype type, char* data, size_t size, [[maybe_unused]] void* userp)
	{
		switch(type)
		{
			case CURLINFO_TEXT:
			{
				spdlog::debug("== Info: {}", std::string_view(data, size));
				break;
			}
			case CURLINFO_HEADER_OUT:
			{
				spdlog::debug("=> Header");
				break;
			}
			case CURLINFO_DATA_OUT:
			{
				spdlog::debug("=> Data");
				break;
			}
			case CURLINFO_HEADER_IN:
			{
				spdlog::debug("<= Header");
				break;
			}
			case CURLINFO_DATA_IN:
			{
				spdlog::debug("<= Data");
				break;
			}
			default:
				break;
		}

		return 0;
	}
}

HttpDispatcher::HttpDispatchHandle::~HttpDispatchHandle()
{
	release();
}

void HttpDispatcher::HttpDispatchHandle::release() noexcept
{
	if(http_handle_)
	{
		curl_easy_cleanup(http_handle_);
		http_handle_ = nullptr;
	}

	if(headers_)
	{
		curl_slist_free_all(headers_);
		headers_ = nullptr;
	}
}

void HttpDispatcher::HttpDispatchHandle::mark_completed()
{
	long response_code = 0;
	curl_easy_getinfo(http_handle_, CURLINFO_RESPONSE_CODE, &response_code);

	if(result_ == CURLE_OPERATION_TIMEDOUT)
	{
		status_ = Status::TIME_OUT;
	}
	else
	{
		status_ = result_ == CURLE_OK && response_code == HTTP_OK ? Status::ACKNOWLEDGED : Status::REJECTED;
	}

	release();

	spdlog::debug("Http call completed: {} {}", response_code, curl_easy_strerror(result_));

	DispatchHandle::mark_completed();
}

IDispatcher::DispatchHandle::Status HttpDispatcher::HttpDispatchHandle::status() const noexcept
{
	return status_;
}

HttpDispatcher::HttpDispatcher(std::chrono::milliseconds dispatch_timeout, std::size_t concurrency_limit)
	: dispatch_timeout_(dispatch_timeout), concurrency_limit_(concurrency_limit)
{
	spdlog::debug("Initializing curl");
	if(curl_global_init(CURL_GLOBAL_ALL))
	{
		throw std::runtime_error("Curl initialization failed");
	}

	spdlog::info("Dispatch transport: http, timeout {} ms, concurrency limit {}", dispatch_timeout_.count(), concurrency_limit_);

	multi_handle_ = curl_multi_init();
	if(!multi_handle_)
	{
		throw std::runtime_error("Curl multi handle initialization failed");
	}
	curl_multi_setopt(multi_handle_, CURLMOPT_MAX_TOTAL_CONNECTIONS, static_cast<long>(concurrency_limit_));

	thread_ = std::jthread([dispatcher = this]()
	{
		thread_body(*dispatcher);
	});
}

HttpDispatcher::~HttpDispatcher()
{
	closed_.test_and_set();
	curl_multi_wakeup(multi_handle_);
	thread_.join();

	for(auto& [easy_handle, handle]: statuses_)
	{
		curl_multi_remove_handle(multi_handle_, easy_handle);
	}
	statuses_.clear();

	curl_multi_cleanup(multi_handle_);
	curl_global_cleanup();
}

void HttpDispatcher::thread_body(HttpDispatcher& dispatcher)
{
	spdlog::info("Http dispatcher - background worker starting...");
	while(true)
	{
		if(dispatcher.closed_.test())
		{
			spdlog::info("Http dispatcher - background worker stopping...");
			return;
		}

		{
			std::unique_lock lock(dispatcher.queue_mutex_);

			while(!dispatcher.handle_queue_.empty())
			{
				auto handle = dispatcher.handle_queue_.front();
				dispatcher.handle_queue_.pop();

				curl_multi_add_handle(dispatcher.multi_handle_, handle->http_handle_);
				dispatcher.statuses_.try_emplace(handle->http_handle_, handle);
			}
		}

		int running = 0;
		if(curl_multi_perform(dispatcher.multi_handle_, &running))
		{
			spdlog::error("Http dispatcher - Perform. Internal error");
			return;
		}

		int message_count = 0;
		CURLMsg* message;
		while((message = curl_multi_info_read(dispatcher.multi_handle_, &message_count)))
		{
			if(message->msg == CURLMSG_DONE)
			{
				CURL* easy_handle = message->easy_handle;
				const auto iter = dispatcher.statuses_.find(easy_handle);
				if(iter == std::end(dispatcher.statuses_))
				{
					continue;
				}

				auto handle = iter->second;
				dispatcher.statuses_.erase(iter);

				handle->result_ = message->data.result;
				curl_multi_remove_handle(dispatcher.multi_handle_, easy_handle);

				handle->mark_completed();
			}
		}

		if(curl_multi_poll(dispatcher.multi_handle_, nullptr, 0, 1000, nullptr))
		{
			spdlog::error("Http dispatcher - Poll. Internal error");
			return;
		}
	}
}

std::shared_ptr<HttpDispatcher::HttpDispatchHandle> HttpDispatcher::prepare_call(const std::string& url, const std::string& body) const
{
	CURL* easy_handle = curl_easy_init();
	if(!easy_handle)
	{
		throw std::runtime_error("Curl easy handle initialization failed");
	}

	auto handle = std::make_shared<HttpDispatchHandle>();
	handle->http_handle_ = easy_handle;
	handle->headers_ = curl_slist_append(nullptr, "Content-Type: application/json");

	curl_easy_setopt(easy_handle, CURLOPT_URL, url.c_str());
	curl_easy_setopt(easy_handle, CURLOPT_HTTPHEADER, handle->headers_);
	curl_easy_setopt(easy_handle, CURLOPT_TIMEOUT_MS, static_cast<long>(dispatch_timeout_.count()));
	curl_easy_setopt(easy_handle, CURLOPT_DEBUGFUNCTION, trace);
	curl_easy_setopt(easy_handle, CURLOPT_VERBOSE, spdlog::should_log(spdlog::level::debug) ? 1L : 0L);
	curl_easy_setopt(easy_handle, CURLOPT_COPYPOSTFIELDS, body.c_str());

	return handle;
}

void HttpDispatcher::enqueue(std::shared_ptr<HttpDispatchHandle> handle)
{
	{
		std::unique_lock lock(queue_mutex_);
		handle_queue_.push(std::move(handle));
	}
	curl_multi_wakeup(multi_handle_);
}

std::shared_ptr<IDispatcher::DispatchHandle> HttpDispatcher::dispatch(const Address& endpoint, const DispatchRequest& request)
{
	const auto url = "http://" + endpoint.to_string() + "/execute";
	auto handle = prepare_call(url, build_execute_payload(request));

	enqueue(handle);
	spdlog::debug("Job {} dispatched to {}", request.job_id, url);

	return handle;
}

void HttpDispatcher::abort(const Address& endpoint, job_id_t job_id)
{
	const auto url = "http://" + endpoint.to_string() + "/abort";
	auto handle = prepare_call(url, build_abort_payload(job_id));

	enqueue(std::move(handle));
	spdlog::debug("Abort of job {} sent to {}", job_id, url);
}
