#ifndef TALUSD_HTTP_DISPATCHER_HPP
#define TALUSD_HTTP_DISPATCHER_HPP

#include <curl/multi.h>

#include <atomic>
#include <chrono>
#include <queue>
#include <thread>
#include <unordered_map>

#include "execution/dispatcher/i_dispatcher.hpp"


class HttpDispatcher final: public IDispatcher
{
public:
	class HttpDispatchHandle final: public DispatchHandle
	{
	public:
		~HttpDispatchHandle() override;

		Status status() const noexcept override;

	private:
		friend class HttpDispatcher;

		Status status_ = Status::PENDING;
		CURLcode result_ = CURLE_OK;

		CURL* http_handle_ = nullptr;
		struct curl_slist* headers_ = nullptr;

		void mark_completed() override;
		void release() noexcept;
	};

	HttpDispatcher(std::chrono::milliseconds dispatch_timeout, std::size_t concurrency_limit);
	~HttpDispatcher();

	std::shared_ptr<DispatchHandle> dispatch(const Address& endpoint, const DispatchRequest& request) override;
	void abort(const Address& endpoint, job_id_t job_id) override;

private:
	std::jthread thread_;
	std::atomic_flag closed_;

	std::chrono::milliseconds dispatch_timeout_;
	std::size_t concurrency_limit_ = 1;

	std::mutex queue_mutex_;
	std::queue<std::shared_ptr<HttpDispatchHandle>> handle_queue_;

	std::unordered_map<CURL*, std::shared_ptr<HttpDispatchHandle>> statuses_;

	CURLM* multi_handle_;

	std::shared_ptr<HttpDispatchHandle> prepare_call(const std::string& url, const std::string& body) const;
	void enqueue(std::shared_ptr<HttpDispatchHandle> handle);

	static void thread_body(HttpDispatcher& dispatcher);
};

#endif //TALUSD_HTTP_DISPATCHER_HPP
