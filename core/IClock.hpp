#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace geotrack {

class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual int64_t epochMillis() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    int64_t epochMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count();
    }

    std::string iso8601() const override;
};

} // namespace geotrack
