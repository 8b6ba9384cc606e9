/*  This file is part of Serbridge, a library for cycle-accurate serial protocol engines.
	Copyright (C) 2021 Michael Offel, Andreas Ley
	Copyright (C) 2026 The Serbridge developers

	Serbridge is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Serbridge is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include "Exceptions.h"

#include <yaml-cpp/yaml.h>
#include <magic_enum.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <filesystem>
#include <vector>

namespace sbr::utils
{
	/// Matches @p str against @p pattern in which '*' matches anything except a path separator.
	/// @return The matched prefix of @p str or nullopt.
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str);
	/// Replaces all occurrences of $(NAME) with the value of the environment variable NAME.
	std::string replaceEnvVars(const std::string& src);

	/**
	 * @brief Read only view into a stack of yaml documents.
	 * @details Files loaded later take precedence over files loaded earlier. Keys may be paths separated by '/'
	 * and map keys in the documents may contain '*' wildcards that match any single path element.
	 */
	class YamlConfigTree 
	{
	public:
		YamlConfigTree() = default;
		YamlConfigTree(YAML::Node node);

		YamlConfigTree operator[](std::string_view path) const;
		template<typename T> T as(const T& def) const;
		template<typename T> T as() const;

		void loadFromFile(const std::filesystem::path &filename);
		void loadFromString(const std::string &yaml);

	protected:
		std::vector<YAML::Node> m_nodes;
	};

	template<typename T>
	inline T YamlConfigTree::as(const T& def) const
	{
		if (m_nodes.size() != 1)
			return def;

		T ret;
		try {
			ret = m_nodes.front().as<T>();
		} catch (const YAML::BadConversion &) {
			auto str = m_nodes.front().as<std::string>();
			if (str.empty() || str[0] != '$')
				throw;
			str = replaceEnvVars(str);
			if constexpr (std::is_same_v<T, bool>) {
				if (str == "false" || str == "No")
					ret = false;
				else if (str == "true" || str == "Yes")
					ret = true;
				else 
					throw;
			} else
				if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>)
					ret = boost::lexical_cast<T>(str);
				else throw;
		}
		return ret;
	}

	template<typename T>
	inline T YamlConfigTree::as() const
	{
		if (m_nodes.size() != 1)
			throw std::runtime_error{ "non optional config value not found" };

		return m_nodes.front().as<T>();
	}

	template<>
	inline std::string YamlConfigTree::as(const std::string& def) const
	{
		if (m_nodes.size() != 1)
			return replaceEnvVars(def);
		return replaceEnvVars(m_nodes.front().as<std::string>());
	}

	template<>
	inline std::string YamlConfigTree::as() const
	{
		if (m_nodes.size() != 1)
			throw std::runtime_error{ "non optional config value not found" };

		return replaceEnvVars(m_nodes.front().as<std::string>());
	}

	using ConfigTree = YamlConfigTree;
}

namespace YAML
{
	/// Decodes enums from their case insensitive names, used for modes and log severities.
	template<typename T>
	struct convert
	{
		static auto encode(T value) -> std::enable_if_t<std::is_enum_v<T>, Node>
		{
			return Node{ std::string{ magic_enum::enum_name(value) } };
		}

		static auto decode(const Node& node, T& out) -> std::enable_if_t<std::is_enum_v<T>, bool>
		{
			const std::string name = node.as<std::string>();
			auto value = magic_enum::enum_cast<T>(name, [](char a, char b) { return std::tolower(a) == std::tolower(b); });
			if (!value) {
				auto names = magic_enum::enum_names<T>();
				std::vector<std::string> valid(names.begin(), names.end());
				throw std::runtime_error{ (boost::format("unknown value '%s' for %s, valid values are %s")
					% name % magic_enum::enum_type_name<T>() % boost::algorithm::join(valid, ", ")).str() };
			}
			out = *value;
			return true;
		}
	};
}
