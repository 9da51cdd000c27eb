#pragma once
#include <chrono>

struct ReactorConfig {
    std::chrono::milliseconds selectInterval{1000};
    bool soReuseAddress = false;
    int rcvBufSize = 0;   // <= 0 leaves the OS default
    int backlogSize = 0;  // <= 0 means SOMAXCONN

    void validate() const;
};
