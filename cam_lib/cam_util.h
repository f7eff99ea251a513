#pragma once

#include <string>
#include <string_view>
#include <map>
#include <chrono>
#include <utility>

#include <fmt/format.h>

namespace cam_util
{
    //////////////////////////////////////////////////////////////////////

    struct cam_timer
    {
        cam_timer() = default;

        std::chrono::time_point<std::chrono::high_resolution_clock> time_point_begin;

        void reset()
        {
            time_point_begin = std::chrono::high_resolution_clock::now();
        }

        double elapsed_seconds() const
        {
            auto time_point_end = std::chrono::high_resolution_clock::now();
            auto diff = time_point_end - time_point_begin;
            auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(diff);
            return microseconds.count() / 1000000.0;
        }
    };

    //////////////////////////////////////////////////////////////////////

    std::string to_lowercase(std::string const &s);

    std::string_view trim(std::string_view s);

    //////////////////////////////////////////////////////////////////////
    // get something from a map

    template <typename T, typename S> bool map_get_if_found(std::map<T, S> const &m, T const &key, S *const value)
    {
        auto f = m.find(key);
        if(f != m.end()) {
            *value = f->second;
            return true;
        }
        return false;
    }

    namespace util
    {
        //////////////////////////////////////////////////////////////////////
        // SCOPED admin

        template <typename FUNC> struct defer_finalizer
        {
            FUNC lambda;
            bool cancelled;

            template <typename T> defer_finalizer(T &&f) : lambda(std::forward<T>(f)), cancelled(false)
            {
            }

            defer_finalizer() = delete;
            defer_finalizer(defer_finalizer const &) = delete;
            defer_finalizer(defer_finalizer &&) = delete;

            void cancel()
            {
                cancelled = true;
            }

            ~defer_finalizer()
            {
                if(!cancelled) {
                    lambda();
                }
            }
        };

        [[maybe_unused]] static struct
        {
            template <typename F> [[nodiscard]] defer_finalizer<F> operator<<(F &&f)
            {
                return defer_finalizer<F>(std::forward<F>(f));
            }
        } deferrer;

    }    // namespace util

}    // namespace cam_util

//////////////////////////////////////////////////////////////////////
// SCOPED: assign SCOPED(<lambda>) to a variable which calls the lambda when it goes out of scope
// it can be cancelled...
//
// e.g.
//
// {
//     auto remove_partial = SCOPED([&]() { std::filesystem::remove(path); });
//     ...
//     if(all_written) {
//          remove_partial.cancel();
//     }
// } <- lambda called here (if cancel() was not called)
//

#define SCOPED cam_util::util::deferrer <<

//////////////////////////////////////////////////////////////////////
// if there's a `to_string()` member function, you can use this
// to make a type formattable. If there's no to_string() method, compile fails

#define CAM_MAKE_FORMATTER(CAM_TYPE)                                             \
    template <> struct fmt::formatter<CAM_TYPE> : fmt::formatter<std::string>    \
    {                                                                            \
        auto format(CAM_TYPE const &e, fmt::format_context &ctx) const           \
        {                                                                        \
            return fmt::format_to(ctx.out(), "{}", e.to_string());               \
        }                                                                        \
    }
