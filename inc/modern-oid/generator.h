// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_OID_GENERATOR_H_INCLUDED
#define HEADER_MODERN_OID_GENERATOR_H_INCLUDED

#include <modern-oid/object_id.h>

#if MOID_MULTITHREADED
    #include <atomic>
#endif

namespace moid {

    namespace impl {
        class default_generator_state;
    }

    /**
     * Generator of object_id values
     *
     * Holds a machine discriminator, a process discriminator and a 24-bit counter.
     * The counter is the only mutable state and is advanced atomically so a single
     * generator can be used from any number of threads concurrently.
     *
     * Most code should use object_id::generate() which uses the process-wide
     * default_generator(). Separate instances are useful when you need explicit
     * control over the discriminators.
     */
    class object_id_generator {
    public:
        /// Initial state of a generator
        struct seed {
            /// Machine discriminator, must fit in 24 bits
            uint32_t machine = 0;
            /// Process discriminator
            uint16_t pid = 0;
            /// Starting counter value. Only the low 24 bits are used
            uint32_t counter = 0;

            /**
             * Derives seed from the running system
             *
             * machine is the low 24 bits of the host name hash plus instance,
             * pid is the low 16 bits of the process id (or 0 if unavailable) and
             * counter is a random value. Never fails.
             */
            MOID_EXPORTED static auto from_system(uint32_t instance = 1) -> seed;
        };

    public:
        /// Constructs generator seeded from the running system
        MOID_EXPORTED object_id_generator();

        /**
         * Constructs generator with explicit seed
         *
         * Throws object_id_error(errc::out_of_range) if the machine does not fit in 24 bits
         */
        MOID_EXPORTED explicit object_id_generator(const seed & s);

        object_id_generator(const object_id_generator &) = delete;
        object_id_generator & operator=(const object_id_generator &) = delete;

        /// Generates an object_id with the current time
        auto generate() -> object_id
            { return this->generate(std::chrono::system_clock::now()); }

        /// Generates an object_id with a given timestamp
        auto generate(int32_t timestamp) -> object_id
            { return object_id(timestamp, this->m_machine, this->m_pid, this->next_increment()); }

        /**
         * Generates an object_id with a given time
         *
         * Throws object_id_error(errc::out_of_range) if the time is outside of the 32-bit seconds range
         */
        template<class Duration>
        auto generate(std::chrono::time_point<std::chrono::system_clock, Duration> when) -> object_id
            { return this->generate(impl::to_timestamp(when)); }

        auto machine() const noexcept -> uint32_t
            { return this->m_machine; }

        auto pid() const noexcept -> uint16_t
            { return this->m_pid; }

    private:
        friend class impl::default_generator_state;

        void reseed(const seed & s) noexcept;

        auto next_increment() noexcept -> uint32_t {
        #if MOID_MULTITHREADED
            uint32_t val = this->m_counter.fetch_add(1, std::memory_order_relaxed) + 1;
        #else
            uint32_t val = ++this->m_counter;
        #endif
            return val % (impl::max_24bit + 1);
        }

    private:
        uint32_t m_machine;
        uint16_t m_pid;
    #if MOID_MULTITHREADED
        std::atomic<uint32_t> m_counter;
    #else
        uint32_t m_counter;
    #endif
    };

    /**
     * Returns the process-wide generator used by object_id::generate()
     *
     * It is created on first use. In a forked child the next call re-seeds it in place
     * with the child's pid and a new counter start, so references obtained before the
     * fork stay valid but see the new values only after the child calls this function.
     */
    MOID_EXPORTED auto default_generator() -> object_id_generator &;
}

#endif
