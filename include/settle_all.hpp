// ===================== include/settle_all.hpp =====================
#pragma once
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace geoip
{
    // Outcome of one task: a value, or the exception it ended with.
    template <typename T>
    struct Settled
    {
        std::optional<T> value;
        std::exception_ptr error;

        bool ok() const { return value.has_value(); }
    };

    // Message of a stored exception, for logs.
    std::string describe(const std::exception_ptr &error);

    // Runs every task on its own thread and waits for all of them. One task failing neither
    // cancels the others nor ends the wait early; outcomes come back in task order.
    template <typename T>
    std::vector<Settled<T>> settle_all(const std::vector<std::function<T()>> &tasks)
    {
        std::vector<std::future<T>> futures(tasks.size());
        std::vector<Settled<T>> out(tasks.size());

        for (size_t i = 0; i < tasks.size(); ++i)
        {
            try
            {
                futures[i] = std::async(std::launch::async, tasks[i]);
            }
            catch (const std::system_error &)
            {
                // no thread available; this task simply fails
                out[i].error = std::current_exception();
            }
        }

        for (size_t i = 0; i < tasks.size(); ++i)
        {
            if (!futures[i].valid())
                continue;
            try
            {
                out[i].value = futures[i].get();
            }
            catch (...)
            {
                out[i].error = std::current_exception();
            }
        }
        return out;
    }
} // namespace geoip
