#pragma once

#include <fmt/core.h>
#include <fmt/color.h>
#include <fmt/ostream.h>

#include <Eigen/Core>

#include <cstdio>
#include <type_traits>
#include <utility>

// Allow fmt::print of Eigen matrices.
template <typename T> struct fmt::formatter<T, std::enable_if_t<std::is_base_of<Eigen::DenseBase<T>, T>::value, char>> : ostream_formatter {};

namespace chartiles {

//
// Progress printing with a quiet switch.
// Warnings and errors always print, errors go to stderr.
//
struct Log {
	bool quiet = false;

	template <class... Args>
	inline void info(fmt::format_string<Args...> f, Args&&... args) const {
		if (!quiet) fmt::print(f, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void header(fmt::format_string<Args...> f, Args&&... args) const {
		if (!quiet) fmt::print(fmt::fg(fmt::color::lime), "{}", fmt::format(f, std::forward<Args>(args)...));
	}

	template <class... Args>
	inline void good(fmt::format_string<Args...> f, Args&&... args) const {
		if (!quiet) fmt::print(fmt::fg(fmt::color::green), "{}", fmt::format(f, std::forward<Args>(args)...));
	}

	template <class... Args>
	inline void warn(fmt::format_string<Args...> f, Args&&... args) const {
		fmt::print(fmt::fg(fmt::color::magenta), "{}", fmt::format(f, std::forward<Args>(args)...));
	}

	template <class... Args>
	inline void error(fmt::format_string<Args...> f, Args&&... args) const {
		fmt::print(stderr, fmt::fg(fmt::color::red), "{}", fmt::format(f, std::forward<Args>(args)...));
	}
};

}
