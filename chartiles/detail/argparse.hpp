#pragma once

#include <fmt/core.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <stdexcept>
#include <type_traits>
#include <cstdio>

namespace chartiles {
namespace {

using Str = std::string;

inline bool is_a_number(const Str& s) {
	try {
		size_t n = 0;
		std::stod(s, &n);
		return n == s.size();
	} catch(const std::exception&) {
		return false;
	}
}

// ad-hoc (zero-config) cli argument parser.
//
// Call some variation of get<T>() to get assigned values.
// A key followed by no value (e.g. "--quiet") is a flag: test it with have().
//
// Note: Keys are not allowed to be numbers, because that would make
// parsing lists of numbers impossible (cannot tell if "-f 1 -1 2" is a
// three-length block assigned to key "f", or if the "-1" is starting a new key)
//

class ArgParser {
	public:

		inline ArgParser(int argc, char** argv) {
			parse(argc, argv);
		}

		inline Str getKeyWithoutDashes(const Str& k) {
			if (k.length() > 2 and k[0] == '-' and k[1] == '-') {
				return k.substr(2);
			}
			else if (k.length() > 1 and k[0] == '-') {
				return k.substr(1);
			} else {
				throw std::runtime_error("invalid key, must start with - or --");
			}
		}

		template <class T>
		inline std::optional<T> get(const Str& k) {

			if (is_a_number(k)) {
				throw std::runtime_error("ArgParser keys are NOT allowed to be numbers.");
			}

			Str kk = getKeyWithoutDashes(k);

			if (map.find(kk) != map.end()) {
				return scanAs<T>(kk, map[kk]);
			}
			return {};
		}

		template <class T>
		inline std::optional<T> get(const Str& k, const T& def) {
			auto r = get<T>(k);
			if (r.has_value()) return r;
			return def;
		}

		template <class ...Choices>
		inline std::optional<std::string> getChoice(const Str& k, Choices... choices_) {

			auto vv = get<Str>(k);
			if (not vv.has_value()) return {};
			auto v = vv.value();

			std::vector<std::string> choices { choices_... };
			for (auto& c : choices) {
				if (v == c) return c;
			}

			throw std::runtime_error(fmt::format("invalid choice '{}' for key '{}'", v, k));
		}

		template <class T>
		inline std::optional<T> get2(const Str& k1, const Str& k2) {
			auto a = get<T>(k1);
			if (a.has_value()) return a;
			return get<T>(k2);
		}
		template <class T>
		inline std::optional<T> get2(const Str& k1, const Str& k2, const T &def) {
			auto a = get<T>(k1);
			if (a.has_value()) return a;
			return get<T>(k2, def);
		}
		template <class ...Choices>
		inline std::optional<std::string> getChoice2(const Str& k1, const Str& k2, Choices... choices_) {
			auto a = getChoice(k1, choices_...);
			if (a.has_value()) return a;
			return getChoice(k2, choices_...);
		}

		inline bool have(const Str& k1) {
			return map.find(getKeyWithoutDashes(k1)) != map.end();
		}
		inline bool have2(const Str& k1, const Str& k2) {
			return have(k1) or have(k2);
		}


	private:
		std::unordered_map<Str, std::vector<Str>> map;

		inline void parse(int argc, char** argv) {
			for (int i=1; i<argc; i++) {
				Str arg{argv[i]};

				if (arg.empty() or arg[0] != '-') continue;

				size_t kstart = 0;
				while (kstart < arg.size() and arg[kstart] == '-') kstart++;
				arg = arg.substr(kstart);

				if (arg.find("=") != std::string::npos) {
					auto f = arg.find("=");
					std::string k = arg.substr(0, f);
					std::string v = arg.substr(f+1);

					if (map.find(k) != map.end()) throw std::runtime_error(fmt::format("duplicate key '{}'", k));
					map[k] = {v};
				} else {
					std::vector<Str> vals;

					// Properly parse numbers.
					while (i+1 < argc and (argv[i+1][0] != '-' or is_a_number(argv[i+1]))) {
						Str val{argv[++i]};
						vals.push_back(val);
					}

					if (map.find(arg) != map.end()) throw std::runtime_error(fmt::format("duplicate key '{}'", arg));
					map[arg] = vals;
				}
			}
		}

		template <class T>
		inline T scanAs(const Str& k, const std::vector<Str>& ss) {
			if constexpr(std::is_same_v<std::vector<std::string>,T>) {
				return ss;
			} else if constexpr(std::is_same_v<std::vector<int>,T>) {
				std::vector<int> out;
				for (const auto& s : ss) out.push_back(std::stoi(s));
				return out;
			} else {
				// A bare flag reads as true.
				if constexpr(std::is_same_v<bool,T>) {
					if (ss.empty()) return true;
				}

				// All of these are scalars.
				if (ss.size() != 1) {
					throw std::runtime_error(fmt::format("key '{}' expects one value, got {}", k, ss.size()));
				}
				const Str& s = ss[0];

				if constexpr(std::is_same_v<bool,T>) {
					return not (s == "0" or s == "off" or s == "no" or s == "n" or s == "N" or s == "" or s == "false" or s == "False");
				} else if constexpr(std::is_integral_v<T>) {
					long i;
					if (sscanf(s.c_str(), "%ld", &i) != 1) throw std::runtime_error(fmt::format("key '{}': '{}' is not an integer", k, s));
					return static_cast<T>(i);
				} else if constexpr(std::is_floating_point_v<T>) {
					double d;
					if (sscanf(s.c_str(), "%lf", &d) != 1) throw std::runtime_error(fmt::format("key '{}': '{}' is not a number", k, s));
					return static_cast<T>(d);
				} else {
					static_assert(std::is_same_v<Str,T>, "ArgParser cannot scan this type");
					return s;
				}
			}
		}

};

}
}
