#pragma once

#include <docfed/core/value.hpp>

#include <chrono>

namespace docfed {

// Source of "now" for refresh windows and snapshot times.
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual Timestamp Now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] Timestamp Now() const override {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return Timestamp{
            std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
    }
};

} // namespace docfed
