/*  This file is part of Serbridge, a library for cycle-accurate serial protocol engines.
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
#include "simulation/pch.h"

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <serbridge/utils/BitFlags.h>
#include <serbridge/utils/BitManipulation.h>
#include <serbridge/utils/ConfigTree.h>
#include <serbridge/utils/Enumerate.h>
#include <serbridge/utils/Range.h>
#include <serbridge/debug/DebugInterface.h>

#include <cstdlib>

using namespace boost::unit_test;
using namespace sbr;
using namespace sbr::utils;


BOOST_AUTO_TEST_CASE(GlobbingMatchPath)
{
	{
		auto m1 = globbingMatchPath("full_match", "full_match");
		BOOST_TEST((m1 && *m1 == "full_match"));
	}
	{
		auto m1 = globbingMatchPath("not", "full_match");
		BOOST_TEST((!m1));
	}
	{
		auto m1 = globbingMatchPath("uart/baud", "uart/baudRate");
		BOOST_TEST((m1 && *m1 == "uart/baud"));
	}
	{
		auto m1 = globbingMatchPath("*", "uart/baudRate");
		BOOST_TEST((m1 && *m1 == "uart"));
	}
	{
		auto m1 = globbingMatchPath("spi/*", "spi/width/x");
		BOOST_TEST((m1 && *m1 == "spi/width"));
	}
	{
		auto m1 = globbingMatchPath("spi/w*h", "spi/width");
		BOOST_TEST((m1 && *m1 == "spi/width"));
	}
	{
		auto m1 = globbingMatchPath("*/synchronizerStages", "uart/synchronizerStages");
		BOOST_TEST((m1 && *m1 == "uart/synchronizerStages"));
	}
}

BOOST_AUTO_TEST_CASE(EnvVarReplacement)
{
	BOOST_TEST(replaceEnvVars("test") == "test");

	BOOST_CHECK_THROW(replaceEnvVars("$(SERBRIDGE_UNDEFINED_VAR)"), std::runtime_error);

	setenv("SERBRIDGE_TEST_VAR", "str str", 1);
	BOOST_TEST(replaceEnvVars("test $(SERBRIDGE_TEST_VAR) tust") == "test str str tust");
}

BOOST_AUTO_TEST_CASE(ConfigTreePathSearch)
{
	YAML::Node root;

	root["sub1"]["sub2"]["sub3"]["0"] = 5;
	root["sub1"]["sub2/sub3"]["1"] = 6;
	root["sub1/sub2/sub3"]["2"] = 7;
	root["sub1/donotmatch/sub3"]["2"] = 1;
	root["sub1/*/sub3"]["3"] = 8;
	root["sub1/*"]["sub3"]["4"] = "9";

	root["sub1"]["sub2"]["sub3"]["overload"] = 1;
	root["sub1"]["sub2/sub3"]["overload"] = 2;

	YamlConfigTree cfg{ root };

	auto node = cfg["sub1/sub2/sub3"];
	BOOST_TEST(node["0"].as(0) == 5);
	BOOST_TEST(node["1"].as(0) == 6);
	BOOST_TEST(node["2"].as(0) == 7);
	BOOST_TEST(node["3"].as(0) == 8);
	BOOST_TEST(node["4"].as<std::string>("0") == "9");
	BOOST_TEST(node["overload"].as(0) == 2);
	BOOST_TEST(node["missing"].as(42) == 42);
	BOOST_TEST(cfg["sub1/sub2/sub3/0"].as(0) == 5);
}

BOOST_AUTO_TEST_CASE(ConfigTreeLayeredDocuments)
{
	YamlConfigTree cfg;
	cfg.loadFromString("uart:\n  baudRate: 9600\n  oversampling: 8\nspi:\n  width: 16\n");
	cfg.loadFromString("uart:\n  baudRate: 19200\n");

	BOOST_TEST(cfg["uart/baudRate"].as(0) == 19200);
	BOOST_TEST(cfg["uart/oversampling"].as(0) == 8);
	BOOST_TEST(cfg["spi/width"].as(0) == 16);
	BOOST_TEST(cfg["uart"]["oversampling"].as(0) == 8);

	BOOST_CHECK_THROW(cfg.loadFromString("- not\n- a map\n"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ConfigTreeEnvironmentValues)
{
	setenv("SERBRIDGE_TEST_BAUD", "57600", 1);
	setenv("SERBRIDGE_TEST_ENABLE", "false", 1);

	YamlConfigTree cfg;
	cfg.loadFromString("baudRate: $(SERBRIDGE_TEST_BAUD)\nenabled: $(SERBRIDGE_TEST_ENABLE)\nname: bridge_$(SERBRIDGE_TEST_BAUD)\n");

	BOOST_TEST(cfg["baudRate"].as<std::uint64_t>(0) == 57600);
	BOOST_TEST(cfg["enabled"].as(true) == false);
	BOOST_TEST(cfg["name"].as<std::string>() == "bridge_57600");
}

BOOST_AUTO_TEST_CASE(ConfigTreeEnumLoad)
{
	enum class TestEnum
	{
		TE_1,
		TE_2,
		TE_3
	};

	YAML::Node root;
	root["v1"] = "TE_1";
	root["v2"] = "te_2";
	root["v3"] = "TE_3";
	root["v4"] = "TE_4";
	YamlConfigTree cfg{ root };

	BOOST_TEST((cfg["v1"].as(TestEnum::TE_3) == TestEnum::TE_1));
	BOOST_TEST((cfg["v2"].as(TestEnum::TE_3) == TestEnum::TE_2));
	BOOST_TEST((cfg["v3"].as(TestEnum::TE_1) == TestEnum::TE_3));
	BOOST_CHECK_THROW((cfg["v4"].as(TestEnum::TE_1)), std::runtime_error);
	BOOST_TEST((cfg["v5"].as(TestEnum::TE_1) == TestEnum::TE_1));
}

BOOST_AUTO_TEST_CASE(BitFlagsPacking)
{
	enum class Flag { a, b, c };

	BitFlags<Flag> flags;
	flags.insert(Flag::a).set(Flag::c, true).set(Flag::b, false);
	BOOST_TEST(flags.contains(Flag::a));
	BOOST_TEST(!flags.contains(Flag::b));
	BOOST_TEST(flags.raw() == 0b101);

	flags.clear(Flag::a);
	BOOST_TEST((flags == BitFlags<Flag>(0b100)));
}

BOOST_AUTO_TEST_CASE(BitManipulation)
{
	BOOST_TEST(bitMaskRange(0, 3) == 0b111);
	BOOST_TEST(bitMaskRange(4, 2) == 0b110000);
	BOOST_TEST(bitMaskRange(0, 64) == ~std::uint64_t(0));
	BOOST_TEST(bitExtract(0xA5, 7));
	BOOST_TEST(!bitExtract(0xA5, 6));
}

BOOST_AUTO_TEST_CASE(RangeAndEnumerate)
{
	std::vector<int> values;
	for (auto i : Range(2, 5))
		values.push_back(i);
	BOOST_TEST(values == std::vector<int>({2, 3, 4}));

	size_t indexSum = 0;
	for (auto [idx, v] : Enumerate(values)) {
		BOOST_TEST(v == int(idx) + 2);
		indexSum += idx;
	}
	BOOST_TEST(indexSum == 3);
}

BOOST_AUTO_TEST_CASE(DesignErrorCarriesLocationAndHint)
{
	try {
		SBR_DESIGNCHECK_HINT(1 + 1 == 3, "Arithmetic is broken.");
		BOOST_FAIL("No exception thrown");
	} catch (const DesignError &e) {
		std::string what = e.what();
		BOOST_TEST(what.find("Design failed") != std::string::npos);
		BOOST_TEST(what.find("Hint: Arithmetic is broken.") != std::string::npos);
		BOOST_TEST(what.find("utils.cpp") != std::string::npos);

		std::ostringstream printed;
		printed << e;
		BOOST_TEST(printed.str().find("Stack trace") != std::string::npos);
	}

	BOOST_CHECK_THROW(SBR_ASSERT(false), InternalError);
}

BOOST_AUTO_TEST_CASE(LogMessagesReachBackend)
{
	auto &memory = dbg::logMemory();

	enum class Color { red, green };
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_UART << "value " << 42 << " is " << Color::green);
	dbg::log(dbg::LogMessage("plain"));

	BOOST_TEST(memory.messages().size() == 2);
	BOOST_TEST(memory.count(dbg::LogMessage::LOG_WARNING) == 1);
	BOOST_TEST(memory.messages().front().source() == dbg::LogMessage::LOG_UART);
	BOOST_TEST(memory.messages().front().text() == "value 42 is green");

	dbg::logNone();
}
