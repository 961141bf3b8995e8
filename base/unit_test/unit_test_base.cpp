// Copyright (C) 2020-2024 Sami Väisänen
// Copyright (C) 2020-2024 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "config.h"

#include "warnpush.h"
#  include <nlohmann/json.hpp>
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

#include "base/test_minimal.h"
#include "base/test_float.h"
#include "base/format.h"
#include "base/json.h"
#include "base/hash.h"
#include "base/random.h"
#include "base/utility.h"
#include "base/bitflag.h"

namespace {
enum class Fruit {
    Apple, Banana, Kiwi
};
enum class Flags {
    Foo, Bar, Baz
};
} // namespace

void unit_test_format()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::FormatString("foo") == "foo");
    TEST_REQUIRE(base::FormatString("%1", 1) == "1");
    TEST_REQUIRE(base::FormatString("%1 %2", "foo", std::string("bar")) == "foo bar");
    TEST_REQUIRE(base::FormatString("%2 %1", 1, 2) == "2 1");
    TEST_REQUIRE(base::FormatString("%1%1", true) == "truetrue");
    TEST_REQUIRE(base::FormatString("%1", Fruit::Kiwi) == "Kiwi");
    TEST_REQUIRE(base::FormatString("%1", glm::vec2(1.0f, 2.0f)) == "[1.00 2.00]");

    // two digit indices
    TEST_REQUIRE(base::FormatString("%1 %10", 1, 2, 3, 4, 5, 6, 7, 8, 9, 10) == "1 10");

    base::bitflag<Flags> bits;
    bits.set(Flags::Foo, true);
    bits.set(Flags::Baz, true);
    TEST_REQUIRE(base::FormatString("%1", bits) == "Foo|Baz");

    TEST_REQUIRE(base::TrimString("  foo ") == "foo");
    TEST_REQUIRE(base::TrimString("\tfoo bar\n") == "foo bar");
    TEST_REQUIRE(base::TrimString("   ") == "");

    TEST_REQUIRE(base::ToChars(0.5f) == "0.50");
    TEST_REQUIRE(base::ToChars(0.5f, 3) == "0.500");
    TEST_REQUIRE(base::ToChars(-1.0f, 3) == "-1.000");
    TEST_REQUIRE(base::ToChars(123) == "123");
    TEST_REQUIRE(base::ToChars(123u) == "123");
}

void unit_test_json()
{
    TEST_CASE(test::Type::Feature)

    nlohmann::json json;
    base::JsonWrite(json, "int", 123);
    base::JsonWrite(json, "float", 1.5f);
    base::JsonWrite(json, "str", std::string("hello"));
    base::JsonWrite(json, "bool", true);
    base::JsonWrite(json, "vec3", glm::vec3(1.0f, 2.0f, 3.0f));
    base::JsonWrite(json, "fruit", Fruit::Banana);

    int ival = 0;
    float fval = 0.0f;
    std::string sval;
    bool bval = false;
    glm::vec3 vval;
    Fruit fruit = Fruit::Apple;
    TEST_REQUIRE(base::JsonReadSafe(json, "int", &ival));
    TEST_REQUIRE(base::JsonReadSafe(json, "float", &fval));
    TEST_REQUIRE(base::JsonReadSafe(json, "str", &sval));
    TEST_REQUIRE(base::JsonReadSafe(json, "bool", &bval));
    TEST_REQUIRE(base::JsonReadSafe(json, "vec3", &vval));
    TEST_REQUIRE(base::JsonReadSafe(json, "fruit", &fruit));
    TEST_REQUIRE(ival == 123);
    TEST_REQUIRE(fval == real::float32(1.5f));
    TEST_REQUIRE(sval == "hello");
    TEST_REQUIRE(bval == true);
    TEST_REQUIRE(vval == glm::vec3(1.0f, 2.0f, 3.0f));
    TEST_REQUIRE(fruit == Fruit::Banana);

    // missing values leave the output untouched.
    TEST_REQUIRE(base::JsonReadSafe(json, "missing", &ival) == false);
    TEST_REQUIRE(ival == 123);
    // wrong type is a failure.
    TEST_REQUIRE(base::JsonReadSafe(json, "str", &ival) == false);
    // integers are acceptable floats.
    TEST_REQUIRE(base::JsonReadSafe(json, "int", &fval));
    TEST_REQUIRE(fval == real::float32(123.0f));

    std::optional<int> opt;
    TEST_REQUIRE(base::JsonReadOptional(json, "missing", &opt));
    TEST_REQUIRE(!opt.has_value());
    TEST_REQUIRE(base::JsonReadOptional(json, "int", &opt));
    TEST_REQUIRE(opt.value() == 123);

    {
        const auto& [ok, parsed, error] = base::JsonParse(std::string(R"({"foo": 1, "bar": {"x": 2}})"));
        TEST_REQUIRE(ok);
        TEST_REQUIRE(error.empty());
        TEST_REQUIRE(base::GetJsonObj(parsed, "bar") != nullptr);
        TEST_REQUIRE(base::GetJsonObj(parsed, "foo") == nullptr);
        TEST_REQUIRE(base::GetJsonObj(parsed, "baz") == nullptr);
    }
    {
        const auto& [ok, parsed, error] = base::JsonParse(std::string("{ \"foo\": "));
        TEST_REQUIRE(!ok);
        TEST_REQUIRE(!error.empty());
    }
}

void unit_test_hash()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::hash_combine(0, std::string("foo")) ==
                 base::hash_combine(0, std::string("foo")));
    TEST_REQUIRE(base::hash_combine(0, std::string("foo")) !=
                 base::hash_combine(0, std::string("bar")));

    size_t a = 0;
    a = base::hash_combine(a, glm::vec3(1.0f, 2.0f, 3.0f));
    size_t b = 0;
    b = base::hash_combine(b, glm::vec3(1.0f, 2.0f, 4.0f));
    TEST_REQUIRE(a != b);

    // order matters
    size_t c = 0;
    c = base::hash_combine(c, std::string("foo"));
    c = base::hash_combine(c, std::string("bar"));
    size_t d = 0;
    d = base::hash_combine(d, std::string("bar"));
    d = base::hash_combine(d, std::string("foo"));
    TEST_REQUIRE(c != d);
}

void unit_test_random()
{
    TEST_CASE(test::Type::Feature)

    // same seed yields the same sequence.
    {
        base::RandomGenerator<float> one(42, 0.0f, 1.0f);
        base::RandomGenerator<float> two(42, 0.0f, 1.0f);
        for (int i=0; i<100; ++i)
        {
            const auto a = one();
            const auto b = two();
            TEST_REQUIRE(a == b);
            TEST_REQUIRE(a >= 0.0f && a <= 1.0f);
        }
    }

    // different seeds yield different sequences.
    {
        base::RandomGenerator<unsigned> one(1, 0, 255);
        base::RandomGenerator<unsigned> two(2, 0, 255);
        unsigned same = 0;
        for (int i=0; i<100; ++i)
        {
            if (one() == two())
                ++same;
        }
        TEST_REQUIRE(same < 100);
    }

    // degenerate range
    {
        base::RandomGenerator<int> gen(1);
        TEST_REQUIRE(gen(5, 5) == 5);
        TEST_REQUIRE(gen(7, 3) == 7);
    }
}

void unit_test_utility()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::NextPOT(1) == 1);
    TEST_REQUIRE(base::NextPOT(3) == 4);
    TEST_REQUIRE(base::NextPOT(141) == 256);
    TEST_REQUIRE(base::NextPOT(256) == 256);

    TEST_REQUIRE(base::StartsWith("uPreviousState_color", "uPreviousState_"));
    TEST_REQUIRE(base::StartsWith("foo", "foobar") == false);
    TEST_REQUIRE(base::EndsWith("shader.glsl", ".glsl"));
    TEST_REQUIRE(base::EndsWith("glsl", "shader.glsl") == false);
    TEST_REQUIRE(base::Contains(std::string("foo bar"), std::string("o b")));

    std::vector<int> vec = {1, 3};
    TEST_REQUIRE(base::Contains(vec, 3));
    TEST_REQUIRE(base::Contains(vec, 4) == false);
    TEST_REQUIRE(*base::SafeFind(vec, [](int i) { return i == 3; }) == 3);
    TEST_REQUIRE(base::SafeFind(vec, [](int i) { return i == 4; }) == nullptr);

    std::unordered_map<std::string, int> map;
    map["foo"] = 1;
    TEST_REQUIRE(base::Contains(map, std::string("foo")));
    TEST_REQUIRE(*base::SafeFind(map, std::string("foo")) == 1);
    TEST_REQUIRE(base::SafeFind(map, std::string("bar")) == nullptr);

    std::optional<int> opt;
    TEST_REQUIRE(base::GetOpt(opt) == nullptr);
    opt = 5;
    TEST_REQUIRE(*base::GetOpt(opt) == 5);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_format();
    unit_test_json();
    unit_test_hash();
    unit_test_random();
    unit_test_utility();
    return 0;
}
) // TEST_MAIN
