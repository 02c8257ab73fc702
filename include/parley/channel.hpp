#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace parley {

    // Unbounded multi-producer queue. After close(), pushes are refused and pops drain what is left.
    template <typename T>
    class channel {
      public:
        bool push(T value) {
            {
                std::lock_guard lock{mutex_};
                if (closed_) {
                    return false;
                }
                items_.push_back(std::move(value));
            }
            cv_.notify_one();
            return true;
        }

        std::optional<T> pop() {
            std::unique_lock lock{mutex_};
            cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
            return take(lock);
        }

        template <typename Clock, typename Duration>
        std::optional<T> pop_until(std::chrono::time_point<Clock, Duration> deadline) {
            std::unique_lock lock{mutex_};
            cv_.wait_until(lock, deadline, [this] { return closed_ || !items_.empty(); });
            return take(lock);
        }

        template <typename Rep, typename Period>
        std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
            return pop_until(std::chrono::steady_clock::now() + timeout);
        }

        std::optional<T> try_pop() {
            std::unique_lock lock{mutex_};
            return take(lock);
        }

        std::vector<T> drain() {
            std::lock_guard lock{mutex_};
            std::vector<T> out{};
            out.reserve(items_.size());
            for (auto& item : items_) {
                out.push_back(std::move(item));
            }
            items_.clear();
            return out;
        }

        void close() {
            {
                std::lock_guard lock{mutex_};
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const {
            std::lock_guard lock{mutex_};
            return closed_;
        }

        size_t size() const {
            std::lock_guard lock{mutex_};
            return items_.size();
        }

      private:
        std::optional<T> take(std::unique_lock<std::mutex>&) {
            if (items_.empty()) {
                return std::nullopt;
            }
            auto value = std::move(items_.front());
            items_.pop_front();
            return value;
        }

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<T> items_;
        bool closed_{false};
    };

}  // namespace parley
