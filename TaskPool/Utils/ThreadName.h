#pragma once
#include <pthread.h>
#include <string>

namespace taskpool::utils {

	inline thread_local std::string g_thread_name;

	// Linux caps thread names at 15 chars plus NUL; the logger keeps the full one.
	inline void set_this_thread_name(const std::string& name) {
		g_thread_name = name;
		const std::string kernel_name = name.substr(0, 15);
		pthread_setname_np(pthread_self(), kernel_name.c_str());
	}

	inline const std::string& this_thread_name() { return g_thread_name; }

} // namespace taskpool::utils
