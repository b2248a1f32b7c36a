#pragma once
#include <chrono>
#include <iostream>
#include <string>

struct Timer {
    typedef std::chrono::high_resolution_clock::time_point Time;
    Time t_start;
    bool enabled;

    explicit Timer(bool enabled = true):
        enabled(enabled)
    {
        restart();
    }

    void restart() {
        t_start = std::chrono::high_resolution_clock::now();
    }

    void report(std::string name) {
        if (!enabled) {
            return;
        }
        int time_us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - t_start
        ).count();
        std::string text = name + " took " + std::to_string(time_us) + "us";
        std::cout << text << std::endl;
        restart();
    }

    void log(std::string text) {
        if (!enabled) {
            return;
        }
        std::cout << text << std::endl;
    }
};
