/**
 * @file logging.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Default log destination
 */
#include "CommonTypes.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>

namespace onvifcore
{
using namespace std::chrono;

log_callback_t console_logger(uint32_t debug_level)
{
    const auto start_time = steady_clock::now();
    auto output_mutex = std::make_shared<std::mutex>();

    return [start_time, output_mutex, debug_level](const std::string& msg, uint32_t level)
    {
        const duration<double> elapsed { duration_cast<duration<double>>(steady_clock::now() - start_time) };
        std::lock_guard<std::mutex> lock(*output_mutex);
        if (LOG_LVL_ERROR == level)
        {
            std::cerr << "[" << std::fixed << std::setprecision(6) << elapsed.count() << "] "
                      << " {ERR} " << msg << std::endl;
        }
        else if (level <= debug_level)
        {
            std::cout << "[" << std::fixed << std::setprecision(6) << elapsed.count() << "] "
                      << msg << std::endl;
        }
    };
}

} // end namespace onvifcore
