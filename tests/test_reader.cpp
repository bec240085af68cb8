#include <lineq/core/json.hpp>
#include <lineq/runtime/reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace lineq;
using namespace lineq::runtime;

TEST_CASE("JSON lines bind sanitized keys and the record alias") {
    RecordReader reader;
    auto record = reader.get_record(R"({"user name": "ann", "2nd": 2, "ok": true})");
    REQUIRE(record.has_value());
    REQUIRE(reader.mode() == ReaderMode::TryingJson);

    const auto& ctx = record->context;
    REQUIRE(ctx.at("user_name") == Value("ann"));
    REQUIRE(ctx.at("_2nd") == Value(2));
    REQUIRE(ctx.at("ok") == Value(true));
    REQUIRE(ctx.at("_") == record->value);

    const auto* object = record->value.get_if<Object>();
    REQUIRE(object != nullptr);
    REQUIRE(object->find("user name") != nullptr);
}

TEST_CASE("Defaults sit under JSON records") {
    Object defaults;
    defaults.set("b", 0);
    defaults.set("c", "none");
    RecordReader reader(defaults);

    auto record = reader.get_record(R"({"a": 1, "b": 5})");
    REQUIRE(record.has_value());
    REQUIRE(record->context.at("a") == Value(1));
    REQUIRE(record->context.at("b") == Value(5));
    REQUIRE(record->context.at("c") == Value("none"));

    const auto* object = record->value.get_if<Object>();
    REQUIRE(object != nullptr);
    REQUIRE(object->size() == 3);
}

TEST_CASE("CSV fields are typed as literals") {
    RecordReader reader;
    auto record = reader.get_record("1,2,3");
    REQUIRE(record.has_value());
    REQUIRE(reader.mode() == ReaderMode::CommittedCsv);

    const auto* row = record->value.get_if<Tuple>();
    REQUIRE(row != nullptr);
    REQUIRE(row->items.size() == 3);
    for (const auto& item : row->items) {
        REQUIRE(item.is<std::int64_t>());
    }
    REQUIRE(record->value == make_tuple({1, 2, 3}));
    REQUIRE(record->context.size() == 1);
    REQUIRE(record->context.contains("_"));
}

TEST_CASE("convert_field picks the most specific literal") {
    REQUIRE(convert_field("42").is<std::int64_t>());
    REQUIRE(convert_field("-1.5").is<double>());
    REQUIRE(convert_field("True") == Value(true));
    REQUIRE(convert_field("None").is<None>());
    REQUIRE(convert_field("'quoted'") == Value("quoted"));
    REQUIRE(convert_field("(1, 2)") == make_tuple({1, 2}));
    REQUIRE(convert_field("hello") == Value("hello"));
    REQUIRE(convert_field("1 + 2") == Value("1 + 2"));
    REQUIRE(convert_field("") == Value(""));
}

TEST_CASE("convert_field keeps zero-padded numbers as text") {
    REQUIRE(convert_field("007") == Value("007"));
    REQUIRE(convert_field("07030").is<std::string>());
    REQUIRE(convert_field("0") == Value(0));
    REQUIRE(convert_field("000") == Value(0));
    REQUIRE(convert_field("0.5") == Value(0.5));
    REQUIRE(convert_field("1.").is<double>());
    REQUIRE(convert_field("1.") == Value(1.0));
    REQUIRE(convert_field("2.e1") == Value(20.0));
}

TEST_CASE("split_csv_row handles quoting") {
    auto fields = split_csv_row(R"(a,"b,c",d)");
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 3);
    REQUIRE((*fields)[0] == "a");
    REQUIRE((*fields)[1] == "b,c");
    REQUIRE((*fields)[2] == "d");

    REQUIRE_FALSE(split_csv_row("").has_value());
    REQUIRE_FALSE(split_csv_row(R"(a,"open)").has_value());
}

TEST_CASE("Mode switch to CSV is sticky") {
    RecordReader reader;
    REQUIRE(reader.get_record("not json, at all").has_value());
    REQUIRE(reader.mode() == ReaderMode::CommittedCsv);

    // A valid JSON object is now read as a CSV row, never as JSON.
    auto record = reader.get_record(R"({"a": 1})");
    REQUIRE(record.has_value());
    REQUIRE(record->value.is<Tuple>());
    REQUIRE_FALSE(record->context.contains("a"));
    REQUIRE(reader.mode() == ReaderMode::CommittedCsv);
}

TEST_CASE("Unparseable lines report the line verbatim") {
    RecordReader reader;
    const std::string line = R"(x,"unterminated)";
    auto record = reader.get_record(line);
    REQUIRE_FALSE(record.has_value());
    REQUIRE(record.error().kind == ErrorKind::Parse);
    REQUIRE(record.error().line == line);
}
