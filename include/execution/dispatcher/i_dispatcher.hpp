#ifndef TALUSD_I_DISPATCHER_HPP
#define TALUSD_I_DISPATCHER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "model/job.hpp"
#include "utils/address.hpp"


class IDispatcher
{
public:
	class DispatchHandle
	{
	public:
		enum class Status
		{
			ACKNOWLEDGED,
			PENDING,
			TIME_OUT,
			REJECTED
		};

		virtual ~DispatchHandle() noexcept = default;

		[[nodiscard]] bool completed() const noexcept;
		[[nodiscard]] virtual Status status() const noexcept = 0;

		// Invoked once with the final status. A handle that already completed
		// invokes the callback immediately.
		void set_completion_callback(std::function<void(Status)> callback) noexcept;

	protected:
		virtual void mark_completed();

	private:
		std::function<void(Status)> callback_;

		mutable std::mutex callback_mutex_;
		bool completed_ = false;
	};

	struct DispatchRequest
	{
		job_id_t job_id;
		std::string payload;
	};

	virtual ~IDispatcher() = default;

	virtual std::shared_ptr<DispatchHandle> dispatch(const Address& endpoint, const DispatchRequest& request) = 0;

	// Best effort, the outcome is not reported back.
	virtual void abort(const Address& endpoint, job_id_t job_id) = 0;
};

[[nodiscard]] const char* to_string(IDispatcher::DispatchHandle::Status status) noexcept;

#endif //TALUSD_I_DISPATCHER_HPP
