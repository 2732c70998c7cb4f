#include "execution/dispatcher/i_dispatcher.hpp"


void IDispatcher::DispatchHandle::mark_completed()
{
	std::function<void(Status)> callback;
	{
		std::unique_lock lock(callback_mutex_);
		completed_ = true;
		callback = callback_;
	}

	if(callback)
	{
		callback(status());
	}
}

void IDispatcher::DispatchHandle::set_completion_callback(std::function<void(Status)> callback) noexcept
{
	bool already_completed = false;
	{
		std::unique_lock lock(callback_mutex_);

		callback_ = callback;
		already_completed = completed_;
	}

	if(already_completed && callback)
	{
		callback(status());
	}
}

bool IDispatcher::DispatchHandle::completed() const noexcept
{
	std::unique_lock lock(callback_mutex_);
	return completed_;
}

const char* to_string(IDispatcher::DispatchHandle::Status status) noexcept
{
	using enum IDispatcher::DispatchHandle::Status;
	switch(status)
	{
		case ACKNOWLEDGED:
			return "ACKNOWLEDGED";
		case PENDING:
			return "PENDING";
		case TIME_OUT:
			return "TIME_OUT";
		case REJECTED:
			return "REJECTED";
	}
	return "UNKNOWN";
}
