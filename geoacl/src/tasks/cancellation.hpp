#pragma once
#include <atomic>
#include <memory>
#include <utility>

namespace tasks {

    /**
     * Shared cancellation flag. Copies observe the same flag; a default-constructed token can
     * never be cancelled.
     */
    class CancellationToken {
        std::shared_ptr<std::atomic_bool> _flag;

        explicit CancellationToken(std::shared_ptr<std::atomic_bool> flag)
            : _flag(std::move(flag)) {
        }

    public:
        CancellationToken() noexcept = default;

        static CancellationToken create() {
            return CancellationToken(std::make_shared<std::atomic_bool>(false));
        }

        void cancel() const noexcept {
            if(_flag) {
                _flag->store(true);
            }
        }

        [[nodiscard]] bool isCancelled() const noexcept {
            return _flag && _flag->load();
        }
    };

} // namespace tasks
