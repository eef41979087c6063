#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>

#include <RecordFusion/record_fusion.hpp>

using namespace RecordFusion;
using namespace RecordFusion::options;
using std::string;

struct Header {
    A<string, starts_at<2>, length<10>> name;
    A<int, length<3>> age;
};

struct Price {
    A<string, starts_at<2>, length<4>> sku;
    A<double, length<8>> amount;
    A<float, length<6>> discount;
};

using Record = std::variant<
    A<Header, record_type<"HD">>,
    A<Price, record_type<"PR">>
>;

template<>
struct RecordFusion::RecordFormatName<Record> {
    static constexpr std::string_view value = "Ledger";
};

schema::SchemaDecl ledger_schema() {
    using namespace schema;
    SchemaDecl s;
    s.targetName = "Ledger";
    s.variants.push_back(VariantDecl{"Header", std::nullopt, {schema::record_type("HD")}, {
        FieldDecl{"name", {StartsAt{2}, Length{10}}, ValueKind::text},
        FieldDecl{"age",  {Length{3}}, ValueKind::signed_integer},
    }});
    s.variants.push_back(VariantDecl{"Price", std::nullopt, {schema::record_type("PR"), schema::record_type("PX")}, {
        FieldDecl{"sku",    {StartsAt{2}, Length{4}}, ValueKind::text},
        FieldDecl{"amount", {Length{8}}, ValueKind::floating_point},
        FieldDecl{"paid",   {Length{5}}, ValueKind::boolean},
        FieldDecl{"grade",  {Length{1}}, ValueKind::character},
        FieldDecl{"qty",    {Length{4}}, ValueKind::unsigned_integer},
    }});
    return s;
}

void floating_point_tests() {
    Record r;
    {
        auto res = Parse(r, "PRAB12 1234.5-0.25 ");
        // amount is " 1234.5-" here: the slices are fixed, not the numbers
        assert(!res);
        assert(res.field() == "amount");
    }
    {
        auto res = Parse(r, "PRAB121234.500+0.250");
        assert(res);
        assert(r.index() == 1);
        const Price & p = std::get<1>(r).value;
        assert(p.sku.value == "AB12");
        assert(std::fabs(p.amount.value - 1234.5) < 1e-9);
        assert(std::fabs(p.discount.value - 0.25f) < 1e-6f);
    }
    {
        auto res = Parse(r, "PRAB121.5e+003-1e-02");
        assert(res);
        const Price & p = std::get<1>(r).value;
        assert(std::fabs(p.amount.value - 1500.0) < 1e-9);
        assert(std::fabs(p.discount.value + 0.01f) < 1e-6f);
    }
    {
        // float range check
        auto res = Parse(r, "PRAB12100000001e+099");
        assert(!res);
        assert(res.field() == "discount");
        assert(res.message() == "failed to parse field `discount` in PR record.");
    }
    {
        double d = 0;
        assert(!field_converters::FromText("", d));
        assert(!field_converters::FromText("1.5 ", d));
        assert(!field_converters::FromText("abc", d));
        assert(!field_converters::FromText(string(200, '1'), d));
        assert(field_converters::FromText("-0.5", d) && d == -0.5);
        assert(field_converters::FromText("+0.5", d) && d == 0.5);
        assert(!field_converters::FromText("+", d));
        d = 1.0;
        assert(!field_converters::FromText("+-5", d));
        assert(!field_converters::FromText("++5", d));
        assert(d == 1.0);
    }
}

void interpreter_tests() {
    CompileResult compiled = Compile(ledger_schema());
    assert(compiled);
    const CompiledSchema & s = compiled.schema();
    assert(s.errorTypeName == "LedgerParseError");

    {
        LineParseResult res = ParseLine(s, "HDAlice     030");
        assert(res);
        assert(res.record().recordType == "HD");
        assert(res.record().variantName == "Header");
        assert(res.record().variantIndex == 0);
        assert(res.record().fields.size() == 2);
        assert(std::get<string>(res.record().fields[0].value) == "Alice     ");
        assert(std::get<std::int64_t>(res.record().find("age")->value) == 30);
        assert(res.record().find("missing") == nullptr);
    }
    {
        LineParseResult res = ParseLine(s, "PXAB121234.500falseY0007");
        assert(res);
        const LineRecord & rec = res.record();
        assert(rec.recordType == "PX");
        assert(rec.variantName == "Price");
        assert(rec.variantIndex == 1);
        assert(std::fabs(std::get<double>(rec.find("amount")->value) - 1234.5) < 1e-9);
        assert(!std::get<bool>(rec.find("paid")->value));
        assert(std::get<char>(rec.find("grade")->value) == 'Y');
        assert(std::get<std::uint64_t>(rec.find("qty")->value) == 7);
    }
    {
        LineParseResult res = ParseLine(s, "ZZAlice     030");
        assert(!res);
        assert(res.error() == RecordError::INVALID_RECORD_TYPE);
        assert(res.status().message() == "invalid record type");
        assert(res.record().fields.empty());
    }
    {
        LineParseResult res = ParseLine(s, "H");
        assert(res.error() == RecordError::INVALID_RECORD_TYPE);
    }
    {
        LineParseResult res = ParseLine(s, "HDAlice     0x0");
        assert(res.error() == RecordError::FIELD_PARSE_FAILURE);
        assert(res.status().recordType() == "HD");
        assert(res.status().field() == "age");
        assert(res.status().message() == "failed to parse field `age` in HD record.");
    }
    {
        LineParseResult res = ParseLine(s, "PRAB121234.500falseY000");
        assert(res.error() == RecordError::FIELD_PARSE_FAILURE);
        assert(res.status().field() == "qty");
        assert(res.status().fieldIndex() == 4);
    }
    {
        // Typed path and interpreter agree on the same line
        Record r;
        auto typed = Parse(r, "HDBob       041");
        LineParseResult table = ParseLine(s, "HDBob       041");
        assert(typed && table);
        assert(std::get<0>(r).value.age.value == std::get<std::int64_t>(table.record().find("age")->value));
    }
}

void formatting_tests() {
    CompileResult compiled = Compile(ledger_schema());
    const CompiledSchema & s = compiled.schema();

    const string layout = DescribeLayout(s);
    assert(layout ==
        "\"HD\" Header\n"
        "  name [2, 12) len 10\n"
        "  age [12, 15) len 3\n"
        "\"PR\" Price\n"
        "  sku [2, 6) len 4\n"
        "  amount [6, 14) len 8\n"
        "  paid [14, 19) len 5\n"
        "  grade [19, 20) len 1\n"
        "  qty [20, 24) len 4\n"
        "\"PX\" Price\n"
        "  sku [2, 6) len 4\n"
        "  amount [6, 14) len 8\n"
        "  paid [14, 19) len 5\n"
        "  grade [19, 20) len 1\n"
        "  qty [20, 24) len 4\n");
    // compiling is deterministic
    assert(DescribeLayout(Compile(ledger_schema()).schema()) == layout);
    {
        CompileResult again = Compile(ledger_schema());
        const CompiledSchema owned = again.take();
        assert(DescribeLayout(owned) == layout);
        assert(ParseLine(owned, "HDAlice     030"));
    }

    assert(DescribeLayout<Record>().starts_with("\"HD\" alternative 0\n"));

    {
        Record r;
        auto res = Parse(r, "HDAlice     0x0");
        assert(ParseResultToString(res, "HDAlice     0x0") ==
               "failed to parse field `age` in HD record. [12, 15): 'HDAlice     >>>0x0<<<'");
    }
    {
        Record r;
        auto res = Parse(r, "HDAlice");
        assert(ParseResultToString(res, "HDAlice") ==
               "failed to parse field `name` in HD record. [2, 12): 'HD>>>Alice<<<<line ends at 7>'");
    }
    {
        Record r;
        auto res = Parse(r, "QQ123");
        assert(ParseResultToString(res, "QQ123") == "invalid record type: 'QQ123'");
    }

    {
        schema::SchemaDecl bad = ledger_schema();
        bad.variants[0].fields[1].hints = {schema::Length{0}};
        CompileResult r = Compile(bad);
        assert(!r);
        assert(r.defect() == SchemaDefect::ZERO_LENGTH_FIELD);
        assert(DiagnosticToString(bad, r.diagnostic()) == "`age` field length is zero in variant `Header`");
    }
    {
        schema::SchemaDecl bad = ledger_schema();
        bad.variants[0].fields[1].hints = {schema::StartsAt{SIZE_MAX}, schema::Length{2}};
        CompileResult r = Compile(bad);
        assert(!r);
        assert(r.defect() == SchemaDefect::FIELD_RANGE_OVERFLOW);
        assert(DiagnosticToString(bad, r.diagnostic()) ==
               "`age` field of variant `Header` ends past the largest addressable column");
    }
    {
        // a field near the top of the address range only fails the line
        schema::SchemaDecl far = ledger_schema();
        far.variants[0].fields[1].hints = {schema::StartsAt{SIZE_MAX - 2}, schema::Length{2}};
        CompileResult r = Compile(far);
        assert(r);
        LineParseResult res = ParseLine(r.schema(), "HDAlice     030");
        assert(res.error() == RecordError::FIELD_PARSE_FAILURE);
        assert(res.status().field() == "age");
    }
    {
        schema::SchemaDecl bad = ledger_schema();
        bad.variants[1].attributes[1].value.text = "PXX";
        CompileResult r = Compile(bad);
        assert(r.defect() == SchemaDefect::RECORD_TYPE_LENGTH_MISMATCH);
        assert(DiagnosticToString(bad, r.diagnostic()) ==
               "all `record_type`s must be the same length: variant `Price` declares \"PXX\" (3 characters), expected 2");
    }
    {
        schema::SchemaDecl bad = ledger_schema();
        for(auto & v : bad.variants) v.attributes.clear();
        CompileResult r = Compile(bad);
        assert(r.defect() == SchemaDefect::NO_RECORD_TYPES);
        assert(DiagnosticToString(bad, r.diagnostic()) == "no `record_type`s have been specified, so the parser cannot be built");
    }
}

int main()
{
    floating_point_tests();
    interpreter_tests();
    formatting_tests();
    std::cout << "all runtime tests passed" << std::endl;
}
