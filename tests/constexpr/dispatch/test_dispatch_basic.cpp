#include "test_helpers.hpp"
using namespace TestHelpers;
using namespace RecordFusion::options;
using std::string;

namespace dispatch_basic {

struct Header {
    A<string, starts_at<2>, length<10>> name;
    A<int, length<3>> age;
};

struct Detail {
    A<unsigned, starts_at<2>, length<4>> qty;
    A<char, length<1>> flag;
};

using Record = std::variant<
    A<Header, record_type<"HD">>,
    A<Detail, record_type<"DT">>
>;

static_assert(RecordLayout<Record>::diagnostic);
static_assert(RecordLayout<Record>::tagLength == 2);
static_assert(RecordLayout<Record>::armsCount == 2);
static_assert(LayoutIs<Record, 0>({{2, 12}, {12, 15}}));
static_assert(LayoutIs<Record, 1>({{2, 6}, {6, 7}}));

// Whole record, padding kept in the string field
static_assert(TestParse<Record, 0>("HDAlice     030", [](const Header & h) {
    return h.name.value == "Alice     " && h.age.value == 30;
}));

static_assert(TestParse<Record, 1>("DT0012Y", [](const Detail & d) {
    return d.qty.value == 12 && d.flag.value == 'Y';
}));

// Trailing characters past the last field are ignored
static_assert(ParsesAs<Record, 1>("DT0012Y and the rest"));

// Unknown tag
static_assert(ParseFailsWith<Record>("XX0012Y", RecordError::INVALID_RECORD_TYPE));
// Tag is case sensitive
static_assert(ParseFailsWith<Record>("dt0012Y", RecordError::INVALID_RECORD_TYPE));
// Shorter than the tag
static_assert(ParseFailsWith<Record>("H", RecordError::INVALID_RECORD_TYPE));
static_assert(ParseFailsWith<Record>("", RecordError::INVALID_RECORD_TYPE));

// Output untouched on failure
static_assert([] {
    Record r = A<Detail, record_type<"DT">>{Detail{7u, 'N'}};
    bool failed = !Parse(r, "HDAlice     0x0");
    return failed && r.index() == 1 && std::get<1>(r).value.qty.value == 7;
}());

// Output replaced on success, whatever alternative it held
static_assert([] {
    Record r = A<Detail, record_type<"DT">>{Detail{7u, 'N'}};
    return ParseSucceeds(r, "HDBob       041") && r.index() == 0 && std::get<0>(r).value.age.value == 41;
}());

// Same line, same result
static_assert([] {
    Record a, b;
    return ParseSucceeds(a, "HDAlice     030") && ParseSucceeds(b, "HDAlice     030")
        && std::get<0>(a).value.name.value == std::get<0>(b).value.name.value
        && std::get<0>(a).value.age.value == std::get<0>(b).value.age.value;
}());

} // namespace dispatch_basic
