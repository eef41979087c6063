// Basic RecordFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <RecordFusion/parser.hpp>
#include <RecordFusion/error_formatting.hpp>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

using namespace RecordFusion;
using namespace RecordFusion::options;

// HD<name:10><age:3>
struct Header {
    A<std::string, starts_at<2>, length<10>> name;
    A<int, length<3>> age;
};

// DT<sku:6><qty:4><price:9>
struct Detail {
    A<std::string, starts_at<2>, length<6>> sku;
    A<unsigned, length<4>> qty;
    A<double, length<9>> price;
};

// TR<count:5>, also written as TX by older exporters
struct Trailer {
    A<unsigned, starts_at<2>, ends_at<7>> count;
};

using OrderFile = std::variant<
    A<Header,  record_type<"HD">>,
    A<Detail,  record_type<"DT">>,
    A<Trailer, record_type<"TR">, record_type<"TX">>
>;

int main() {
    const char* lines[] = {
        "HDAlice     030",
        "DTWIDGET000312.500000",
        "DTGADGETx0031.2500000",
        "ZZ whatever",
        "TX00002",
    };

    for(const char* line : lines) {
        OrderFile record;
        auto result = Parse(record, line);

        if (!result) {
            std::cout << "Parse error: " << ParseResultToString(result, line) << std::endl;
            continue;
        }

        std::visit([](const auto & alt) {
            using Rec = std::remove_cvref_t<decltype(alt.value)>;
            if constexpr (std::is_same_v<Rec, Header>) {
                std::cout << "Header: '" << alt.value.name.value << "' age " << alt.value.age.value << std::endl;
            } else if constexpr (std::is_same_v<Rec, Detail>) {
                std::cout << "Detail: " << alt.value.sku.value << " x" << alt.value.qty.value
                          << " @ " << alt.value.price.value << std::endl;
            } else {
                std::cout << "Trailer: " << alt.value.count.value << " details" << std::endl;
            }
        }, record);
    }

    return 0;
}
