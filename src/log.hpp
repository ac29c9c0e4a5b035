#pragma once

#include <chrono>
#include <cstdio>

#define LOGI(fmt, ...) do { fprintf(stdout, "[INFO] " fmt "\n", ##__VA_ARGS__); } while(0)
#define LOGW(fmt, ...) do { fprintf(stdout, "[WARN] " fmt "\n", ##__VA_ARGS__); } while(0)
#define LOGE(fmt, ...) do { fprintf(stderr, "[ERROR] " fmt "\n", ##__VA_ARGS__); } while(0)

using TimePoint = std::chrono::steady_clock::time_point;
using ms = std::chrono::duration<double, std::milli>;

inline double nowMillis() {
    return std::chrono::duration_cast<ms>(std::chrono::steady_clock::now().time_since_epoch()).count();
}
