#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<sstream>

namespace {

bool fails(Jsmn::Parser& p, std::string const& s) {
	try {
		(void) p.parse(s);
	} catch (Jsmn::ParseError const&) {
		return true;
	}
	return false;
}

}

int main() {
	Jsmn::Parser p;

	{
		auto res = p.parse("[]");
		assert(res.is_array());
		assert(res.size() == 0);
	}

	/* Surrounding whitespace is fine.  */
	{
		auto res = p.parse("\n\t \" \"  \n");
		assert(res.is_string());
		assert(std::string(res) == " ");
	}

	/* Nested objects.  */
	{
		auto res = p.parse(R"JSON(
			{ "foo": { "foo": { } }
			, "bar": [1, "2", null, true]
			}
		)JSON");
		assert(res.is_object());
		assert(res.size() == 2);
		assert(res.has("foo"));
		assert(res["foo"].is_object());
		assert(res["foo"]["foo"].is_object());
		assert(res["foo"]["foo"].keys().size() == 0);
		assert(!res.has("quux"));
		assert(res["quux"].is_null());

		auto bar = res["bar"];
		assert(bar.is_array());
		assert(bar.size() == 4);
		assert(bar[std::size_t(0)].is_number());
		assert(double(bar[std::size_t(0)]) == 1);
		assert(bar[1].is_string());
		assert(bar[2].is_null());
		assert(bar[3].is_boolean());
		assert(bool(bar[3]));
		/* Out of range is null.  */
		assert(bar[4].is_null());
	}

	/* Big numbers keep their digits.  */
	{
		auto res = p.parse("[123456789012345678901234567890]");
		assert(res[std::size_t(0)].direct_text()
		       == "123456789012345678901234567890");
	}

	/* JSON text inside JSON string.  */
	{
		auto res = p.parse(R"JSON(
			{
				"array": [
					"}\\[[\""
				]
			}
		)JSON");
		assert(res["array"][std::size_t(0)].is_string());
		assert(std::string(res["array"][std::size_t(0)]) == "}\\[[\"");
	}

	/* Output is compact JSON that parses back.  */
	{
		auto res = p.parse(R"JSON( { "a" : [ 1 , { "b" : "c" } ] } )JSON");
		auto os = std::ostringstream();
		os << res;
		auto again = p.parse(os.str());
		assert(again["a"][1]["b"].is_string());
		assert(std::string(again["a"][1]["b"]) == "c");
		assert(os.str().find('\n') == std::string::npos);
	}

	/* Type errors.  */
	{
		auto res = p.parse("{\"a\": 1}");
		auto thrown = false;
		try {
			(void) std::string(res["a"]);
		} catch (Jsmn::TypeError const&) {
			thrown = true;
		}
		assert(thrown);
	}

	assert(fails(p, ""));
	assert(fails(p, "   "));
	assert(fails(p, "{"));
	assert(fails(p, "{} {}"));
	assert(fails(p, "[] x"));

	/* The parser is still usable after errors.  */
	assert(p.parse("{}").is_object());

	/* The one-shot form.  */
	assert(Jsmn::Object::parse_json("[1, 2]").size() == 2);

	return 0;
}
