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
#include "serbridge/pch.h"

#include "ConfigTree.h"

#include <boost/spirit/home/x3.hpp>
#include <cstdlib>


namespace sbr::utils 
{
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str)
	{
		size_t patternPos = 0;
		while (patternPos < pattern.size() && patternPos < str.size() && str[patternPos] == pattern[patternPos])
			patternPos++;

		if (patternPos == pattern.size())
			return str.substr(0, patternPos);

		if (pattern[patternPos] != '*')
			return std::nullopt;

		std::optional<std::string_view> best_match;
		for (size_t strPos = patternPos; strPos <= str.size(); ++strPos)
		{
			std::string_view sub_str = str.substr(strPos);
			auto match = globbingMatchPath(pattern.substr(patternPos + 1), sub_str);
			if (match)
				best_match = str.substr(0, strPos + match->size());

			if (sub_str.starts_with('/'))
				break;
		}
		return best_match;
	}

	std::string replaceEnvVars(const std::string& src)
	{
		using namespace boost::spirit::x3;

		std::string ret;
		ret.reserve(src.size());

		auto append_var = [&](auto& ctx) {
			const char* var_name = _attr(ctx).c_str();
			const char* var = std::getenv(var_name);
			if (!var)
				throw std::runtime_error(std::string("environment variable '") + var_name + "' not found.");
			_attr(ctx) = var;
		};

		auto parser = *((lit('$') >> '(' >> (*(char_ - ')'))[append_var] >> ')') | char_);
		bool valid = parse(src.cbegin(), src.cend(), parser, ret);
		SBR_ASSERT(valid);
		return ret;
	}

	struct PathMatcher
	{
		void operator () (YAML::Node node, std::string_view path)
		{
			if (!node.IsMap())
				return;

			for (auto it = node.begin(); it != node.end(); ++it)
			{
				const std::string key = it->first.as<std::string>();
				auto match = globbingMatchPath(key, path);
				if (match && match->size() == path.size())
				{
					matches.push_back(it->second);
				}
				else if (match && path[match->size()] == '/')
				{
					(*this)(it->second, path.substr(match->size() + 1));
				}
			}
		}

		std::vector<YAML::Node> matches;
	};

	YamlConfigTree YamlConfigTree::operator[](std::string_view path) const
	{
		YamlConfigTree ret;

		// later documents override earlier ones
		for (auto it = m_nodes.rbegin(); it != m_nodes.rend(); ++it)
		{
			PathMatcher m;
			m(*it, path);
			if (m.matches.empty())
				continue;

			if (!m.matches.front().IsMap())
			{
				ret.m_nodes.push_back(m.matches.front());
				return ret;
			}
		}

		// maps are merged, keeping the override order
		for (const YAML::Node& n : m_nodes)
		{
			PathMatcher m;
			m(n, path);
			for (const YAML::Node& match : m.matches)
				if (match.IsMap())
					ret.m_nodes.push_back(match);
		}
		return ret;
	}

	YamlConfigTree::YamlConfigTree(YAML::Node node) :
		m_nodes{node}
	{
	}

	void YamlConfigTree::loadFromFile(const std::filesystem::path &filename)
	{
		m_nodes.push_back(YAML::LoadFile(filename.string()));

		if (!m_nodes.back().IsMap())
			throw std::runtime_error(filename.string() + " is not a yaml map");
	}

	void YamlConfigTree::loadFromString(const std::string &yaml)
	{
		m_nodes.push_back(YAML::Load(yaml));

		if (!m_nodes.back().IsMap())
			throw std::runtime_error("configuration is not a yaml map");
	}
}
