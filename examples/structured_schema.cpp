// Building a schema at run time and parsing with the table interpreter
// Compile: g++ -std=c++23 -I../include structured_schema.cpp -o structured_schema

#include <RecordFusion/compiler.hpp>
#include <RecordFusion/interpreter.hpp>
#include <RecordFusion/layout_description.hpp>
#include <RecordFusion/error_formatting.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

using namespace RecordFusion;
using namespace RecordFusion::schema;

int main(int argc, char ** argv) {
    SchemaDecl s;
    s.targetName = "Bank";
    s.variants.push_back(VariantDecl{"Account", std::nullopt, {record_type("AC")}, {
        FieldDecl{"number",    {StartsAt{2}, Length{8}}, ValueKind::unsigned_integer},
        FieldDecl{"owner",     {Length{12}}, ValueKind::text},
        FieldDecl{"overdraft", {Length{5}}, ValueKind::boolean},
    }});
    s.variants.push_back(VariantDecl{"Movement", std::nullopt, {record_type("MV")}, {
        FieldDecl{"amount", {StartsAt{2}, EndsAt{11}}, ValueKind::floating_point},
        FieldDecl{"kind",   {Length{1}}, ValueKind::character},
    }});

    // drop the length of `owner` to see how a defect is reported
    if(argc > 1 && std::string(argv[1]) == "--broken") {
        s.variants[0].fields[1].hints.clear();
    }

    CompileResult compiled = Compile(s);
    if(!compiled) {
        std::cout << ErrorTypeName(s.targetName) << ": "
                  << DiagnosticToString(s, compiled.diagnostic()) << std::endl;
        return 1;
    }
    const CompiledSchema table = compiled.take();
    std::cout << DescribeLayout(table);

    for(std::string line: {"AC00012345Jane Doe    false", "MV-120.5000D", "MV   oops  D", "XX"}) {
        LineParseResult res = ParseLine(table, line);
        if(!res) {
            std::cout << table.errorTypeName << ": " << ParseResultToString(res.status(), line) << std::endl;
            continue;
        }
        std::cout << res.record().variantName << ":";
        for(const LineField & f : res.record().fields) {
            std::cout << " " << f.name << "=";
            std::visit([](const auto & v) { std::cout << v; }, f.value);
        }
        std::cout << std::endl;
    }
    return 0;
}
