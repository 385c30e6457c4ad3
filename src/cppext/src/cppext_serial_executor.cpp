#include <cppext_serial_executor.hpp>

#include <future>
#include <utility>

cppext::detail::function_wrapper_t::operator bool() const noexcept
{
    return static_cast<bool>(impl_);
}

void cppext::detail::function_wrapper_t::operator()()
{
    if (impl_)
    {
        impl_->call();
    }
}

cppext::serial_executor_t::serial_executor_t()
    : thread_{&serial_executor_t::worker_thread, this}
{
}

cppext::serial_executor_t::~serial_executor_t()
{
    // An empty task is the stop signal, queued behind any pending work.
    work_queue_.push(detail::function_wrapper_t{});
    thread_.join();
}

void cppext::serial_executor_t::drain()
{
    submit([]() { }).get();
}

void cppext::serial_executor_t::worker_thread()
{
    while (true)
    {
        detail::function_wrapper_t task;
        work_queue_.wait_and_pop(task);
        if (!task)
        {
            break;
        }

        task();
    }
}
