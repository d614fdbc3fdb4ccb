#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>

int main() {
	{
		auto s = Json::Out()
			.start_object()
				.field("number", 42)
				.field("big", std::uint64_t(18446744073709551615ULL))
				.field("text", std::string("a \"quoted\"\nline"))
				.field("none", nullptr)
			.end_object()
			.output()
			;

		auto jsmn = Jsmn::Object::parse_json(s);

		assert(jsmn.is_object());
		assert(jsmn.size() == 4);
		assert(jsmn["number"].is_number());
		assert(((double)jsmn["number"]) == 42);
		assert(jsmn["big"].direct_text() == "18446744073709551615");
		assert(std::string(jsmn["text"]) == "a \"quoted\"\nline");
		assert(jsmn["none"].is_null());
		assert(!jsmn.has("nonexistent"));
	}

	{
		auto s = Json::Out()
			.start_array()
				.start_object()
				.end_object()
				.entry(true)
				.entry(std::unique_ptr<std::string>())
				.entry(Util::make_unique<std::string>("x"))
			.end_array()
			.output()
			;

		auto jsmn = Jsmn::Object::parse_json(s);

		assert(jsmn.is_array());
		assert(jsmn.size() == 4);
		assert(jsmn[std::size_t(0)].is_object());
		assert(jsmn[std::size_t(0)].size() == 0);
		assert(jsmn[1].is_boolean());
		assert((bool)jsmn[1] == true);
		assert(jsmn[2].is_null());
		assert(std::string(jsmn[3]) == "x");
	}

	{
		auto js = Json::Out();
		auto arr = js.start_array();
		for (auto i = 0; i < 8; ++i) {
			arr.entry(i);
		}
		arr.end_array();

		auto jsmn = Jsmn::Object::parse_json(js.output());

		assert(jsmn.is_array());
		assert(jsmn.size() == 8);
		for (auto i = 0; i < 8; ++i) {
			assert(jsmn[std::size_t(i)].is_number());
			assert(((double)jsmn[std::size_t(i)]) == i);
		}
	}

	/* Scalars and re-emitted data.  */
	{
		assert(Json::Out::scalar(std::string("12")).output() == "\"12\"");
		assert(Json::Out::scalar(nullptr).output() == "null");

		auto orig = Jsmn::Object::parse_json("{\"k\": [1, \"v\"]}");
		auto s = Json::Out()
			.start_object()
				.field("inner", orig)
			.end_object()
			.output()
			;
		auto back = Jsmn::Object::parse_json(s);
		assert(std::string(back["inner"]["k"][1]) == "v");
	}

	return 0;
}
