// utils/Log.hpp
#pragma once
#include <fmt/core.h>
#include <cstdio>
#include <string>

inline void LogLine(const std::string& s) {
    std::fputs(s.c_str(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

#define LOGF(...) do { auto _s = fmt::format(__VA_ARGS__); LogLine(_s); } while(0)
