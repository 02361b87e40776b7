//
// Created by ubuntu on 2025/11/12.
//

#ifndef COURIER_THREAD_UTILS_HPP
#define COURIER_THREAD_UTILS_HPP
#include <string>

#if defined(__linux__) || defined(__APPLE__)
    #include <pthread.h>
#endif

namespace courier::ThreadUtils {

    /**
     * @brief 为当前线程设置一个可调试的名称 (gdb / top -H 中可见)。
     * Linux 上名字长度会被截断为 15 个字符。
     */
    inline void set_current_thread_name(const std::string& name) {
#if defined(__linux__)
        const std::string short_name = name.substr(0, 15);
        pthread_setname_np(pthread_self(), short_name.c_str());
#elif defined(__APPLE__)
        pthread_setname_np(name.substr(0, 15).c_str());
#else
        (void)name;
#endif
    }

} // namespace courier::ThreadUtils
#endif //COURIER_THREAD_UTILS_HPP
