#ifndef CPPEXT_SERIAL_EXECUTOR_INCLUDED
#define CPPEXT_SERIAL_EXECUTOR_INCLUDED

#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

namespace cppext::detail
{
    template<typename T>
    class [[nodiscard]] threadsafe_queue_t final
    {
    public:
        threadsafe_queue_t() = default;

        threadsafe_queue_t(threadsafe_queue_t const&) = delete;

        threadsafe_queue_t(threadsafe_queue_t&&) noexcept = delete;

    public:
        ~threadsafe_queue_t() = default;

    public:
        void wait_and_pop(T& value);

        void push(T new_value);

    public:
        threadsafe_queue_t& operator=(threadsafe_queue_t const&) = delete;

        threadsafe_queue_t& operator=(threadsafe_queue_t&&) noexcept = delete;

    private:
        struct [[nodiscard]] node_t final
        {
            std::shared_ptr<T> data;
            std::unique_ptr<node_t> next;
        };

    private:
        [[nodiscard]] node_t* get_tail();

        [[nodiscard]] std::unique_ptr<node_t> pop_head();

    private:
        std::mutex head_mutex_;
        std::unique_ptr<node_t> head_{std::make_unique<node_t>()};

        std::mutex tail_mutex_;
        node_t* tail_{head_.get()};

        std::condition_variable data_cond_;
    };

    template<typename T>
    void threadsafe_queue_t<T>::wait_and_pop(T& value)
    {
        std::unique_lock head_lock{head_mutex_};
        data_cond_.wait(head_lock, [&]() { return head_.get() != get_tail(); });
        value = std::move(*(head_->data));
        [[maybe_unused]] std::unique_ptr const old_head{pop_head()};
    }

    template<typename T>
    void threadsafe_queue_t<T>::push(T new_value)
    {
        auto new_data{std::make_shared<T>(std::move(new_value))};
        auto new_node{std::make_unique<node_t>()};
        {
            std::lock_guard const tail_lock{tail_mutex_};
            tail_->data = std::move(new_data);
            node_t* const new_tail{new_node.get()};
            tail_->next = std::move(new_node);
            tail_ = new_tail;
        }
        data_cond_.notify_one();
    }

    template<typename T>
    threadsafe_queue_t<T>::node_t* threadsafe_queue_t<T>::get_tail()
    {
        std::lock_guard const tail_lock{tail_mutex_};
        return tail_;
    }

    template<typename T>
    std::unique_ptr<typename threadsafe_queue_t<T>::node_t>
    threadsafe_queue_t<T>::pop_head()
    {
        std::unique_ptr old_head{std::move(head_)};
        head_ = std::move(old_head->next);
        return old_head;
    }

    class [[nodiscard]] function_wrapper_t final
    {
    public:
        function_wrapper_t() = default;

        function_wrapper_t(function_wrapper_t const&) = delete;

        template<typename F>
        // cppcheck-suppress noExplicitConstructor
        function_wrapper_t(F&& f)
        requires(!std::same_as<std::remove_cvref_t<F>, function_wrapper_t>);

        function_wrapper_t(function_wrapper_t&& other) noexcept = default;

    public:
        ~function_wrapper_t() = default;

    public:
        [[nodiscard]] explicit operator bool() const noexcept;

        void operator()();

        function_wrapper_t& operator=(function_wrapper_t const&) = delete;

        function_wrapper_t& operator=(
            function_wrapper_t&& other) noexcept = default;

    private:
        // NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
        struct [[nodiscard]] impl_base_t
        {
            virtual void call() = 0;

            virtual ~impl_base_t() = default;
        };

        template<std::invocable Invocable>
        struct [[nodiscard]] impl_type_t final : impl_base_t
        {
            Invocable functor_;

            // cppcheck-suppress noExplicitConstructor
            impl_type_t(Invocable&& functor);

            void call() override;
        };

    private:
        std::unique_ptr<impl_base_t> impl_;
    };

    template<typename F>
    function_wrapper_t::function_wrapper_t(F&& f)
    requires(!std::same_as<std::remove_cvref_t<F>, function_wrapper_t>)
        : impl_{new impl_type_t<std::remove_cvref_t<F>>(std::forward<F>(f))}
    {
    }

    template<std::invocable Invocable>
    function_wrapper_t::impl_type_t<Invocable>::impl_type_t(Invocable&& functor)
        : functor_{std::move(functor)}
    {
    }

    template<std::invocable Invocable>
    void function_wrapper_t::impl_type_t<Invocable>::call()
    {
        std::invoke(functor_);
    }
} // namespace cppext::detail

namespace cppext
{
    // Runs submitted tasks one at a time on a single worker thread, in
    // submission order. Pending tasks are drained before destruction.
    class [[nodiscard]] serial_executor_t final
    {
    public:
        serial_executor_t();

        serial_executor_t(serial_executor_t const&) = delete;

        serial_executor_t(serial_executor_t&&) = delete;

    public:
        ~serial_executor_t();

    public:
        template<typename FunctionType>
        std::future<std::invoke_result_t<FunctionType>> submit(FunctionType f);

        // Blocks until every task submitted so far has run.
        void drain();

    public:
        serial_executor_t& operator=(serial_executor_t const&) = delete;

        serial_executor_t& operator=(serial_executor_t&&) = delete;

    private:
        void worker_thread();

    private:
        detail::threadsafe_queue_t<detail::function_wrapper_t> work_queue_;
        std::thread thread_;
    };

    template<typename FunctionType>
    std::future<std::invoke_result_t<FunctionType>> serial_executor_t::submit(
        FunctionType f)
    {
        using result_type = std::invoke_result_t<FunctionType>;

        std::packaged_task<result_type()> task{std::move(f)};
        std::future<result_type> res{task.get_future()};
        work_queue_.push(std::move(task));
        return res;
    }
} // namespace cppext
#endif
