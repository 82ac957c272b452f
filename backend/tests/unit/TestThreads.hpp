#pragma once
#include <pthread.h>
#include <cstddef>
#include <functional>

// Runs `fn` to completion on a thread with the given stack size.
// Returns false if the thread could not be started.
inline bool RunWithStackSize(std::size_t stackBytes, std::function<void()> fn) {
    pthread_attr_t attr;
    if (pthread_attr_init(&attr) != 0)
        return false;
    if (pthread_attr_setstacksize(&attr, stackBytes) != 0) {
        pthread_attr_destroy(&attr);
        return false;
    }

    auto entry = [](void* arg) -> void* {
        (*static_cast<std::function<void()>*>(arg))();
        return nullptr;
    };

    pthread_t tid;
    const int rc = pthread_create(&tid, &attr, entry, &fn);
    pthread_attr_destroy(&attr);
    if (rc != 0)
        return false;
    return pthread_join(tid, nullptr) == 0;
}
