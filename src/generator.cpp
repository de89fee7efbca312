// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-oid/generator.h>

#include "host_identity.h"
#include "random_seed.h"

#if __has_include(<unistd.h>) && __has_include(<pthread.h>)
    #include <pthread.h>

    #define MOID_HANDLE_FORK 1
#else
    #define MOID_HANDLE_FORK 0
#endif

#if MOID_MULTITHREADED
    #include <mutex>
#endif

#include <csignal>
#include <exception>
#include <new>

using namespace moid;

namespace moid::impl {

    // Owner of the process-wide generator.
    // A forked child only raises a flag (atfork child handlers must stay async-signal-safe).
    // The first default_generator() call in the child then re-seeds the generator in place.
    class default_generator_state {
    public:
        static auto generator() -> object_id_generator & {
            static default_generator_state state;
            state.reseed_if_forked();
            return state.m_generator;
        }

    private:
        default_generator_state() {
        #if MOID_HANDLE_FORK
            if (pthread_atfork(before_fork, after_fork_in_parent, after_fork_in_child) != 0)
                std::terminate();
        #endif
        }

        void reseed_if_forked() {
        #if MOID_MULTITHREADED
            if (!s_forked.load(std::memory_order_acquire))
                return;
            std::lock_guard lock(s_mutex);
            if (!s_forked.load(std::memory_order_relaxed))
                return;
            m_generator.reseed(object_id_generator::seed::from_system());
            s_forked.store(false, std::memory_order_release);
        #else
            if (!s_forked)
                return;
            m_generator.reseed(object_id_generator::seed::from_system());
            s_forked = 0;
        #endif
        }

    #if MOID_HANDLE_FORK
        // Keeps a reseed in another thread from being cut in half by fork()
        static void before_fork() {
        #if MOID_MULTITHREADED
            s_mutex.lock();
        #endif
        }

        static void after_fork_in_parent() {
        #if MOID_MULTITHREADED
            s_mutex.unlock();
        #endif
        }

        static void after_fork_in_child() {
        #if MOID_MULTITHREADED
            //the child is single threaded here and the inherited mutex is locked
            new (&s_mutex) std::mutex;
            s_forked.store(true, std::memory_order_relaxed);
        #else
            s_forked = 1;
        #endif
        }
    #endif

    private:
        object_id_generator m_generator;

    #if MOID_MULTITHREADED
        static_assert(std::atomic<bool>::is_always_lock_free);

        static inline std::atomic<bool> s_forked{false};
        static inline std::mutex s_mutex{};
    #else
        static inline volatile std::sig_atomic_t s_forked = 0;
    #endif
    };
}

auto object_id_generator::seed::from_system(uint32_t instance) -> seed {
    seed ret;
    ret.machine = (impl::hash_name(impl::get_host_name()) + instance) & impl::max_24bit;
    ret.pid = impl::get_process_discriminator();
    ret.counter = impl::get_random_seed();
    return ret;
}

object_id_generator::object_id_generator():
    object_id_generator(seed::from_system())
{}

object_id_generator::object_id_generator(const seed & s):
    m_machine(s.machine),
    m_pid(s.pid),
    m_counter(s.counter & impl::max_24bit)
{
    if ((s.machine & ~impl::max_24bit) != 0)
        MOID_THROW(object_id_error(errc::out_of_range, "The machine value must be between 0 and 16777215 (it must fit in 3 bytes)"));
}

void object_id_generator::reseed(const seed & s) noexcept {
    this->m_machine = s.machine & impl::max_24bit;
    this->m_pid = s.pid;
#if MOID_MULTITHREADED
    this->m_counter.store(s.counter & impl::max_24bit, std::memory_order_relaxed);
#else
    this->m_counter = s.counter & impl::max_24bit;
#endif
}

auto moid::default_generator() -> object_id_generator & {
    return impl::default_generator_state::generator();
}
