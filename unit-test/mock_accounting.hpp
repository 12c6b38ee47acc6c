#pragma once

#include "accounting.hpp"
#include "gmock/gmock.h"

class mock_accounting : public runexec::accounting {
public:
    MOCK_METHOD(void, attach, (pid_t pid), (override));
    MOCK_METHOD(void, kill_all, (), (override));
    MOCK_METHOD(bool, has_cpuset, (), (const, override));
    MOCK_METHOD(double, cpu_time, (), (override));
    MOCK_METHOD((std::map<int, double>), cpu_time_per_core, (), (override));
    MOCK_METHOD(std::optional<int64_t>, memory_peak, (), (override));
    MOCK_METHOD(bool, memory_exhausted, (), (override));
};
