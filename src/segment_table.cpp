#include <libfwpkg/segment_table.hpp>
#include <libfwpkg/system_error.hpp>

#include <libfwpkg/detail/grammar.hpp>

#include <iterator>
#include <tuple>

namespace fwpkg {

bool operator== (const SegmentEntry& lhs, const SegmentEntry& rhs) {
    return std::tie(lhs.id, lhs.offset, lhs.size, lhs.flags)
        == std::tie(rhs.id, rhs.offset, rhs.size, rhs.flags);
}

bool operator!= (const SegmentEntry& lhs, const SegmentEntry& rhs) {
    return !(lhs == rhs);
}

SegmentTable parseSegmentTable (boost::asio::const_buffer data, uint64_t count) {
    auto available = boost::asio::buffer_size(data);
    auto complete = available / kRecordSize;
    if (count > complete) {
        throw PackageError{Status::TRUNCATED_INPUT, kHeaderSize + complete * kRecordSize};
    }

    auto first = static_cast<const uint8_t*>(data.data());
    auto last = first + count * kRecordSize;
    auto table = SegmentTable{};
    table.reserve(static_cast<std::size_t>(count));
    grammar::SegmentTableParser<const uint8_t*> parser;
    if (!grammar::qi::parse(first, last, parser(static_cast<std::size_t>(count)), table)) {
        throw PackageError{Status::TRUNCATED_INPUT, kHeaderSize + table.size() * kRecordSize};
    }
    return table;
}

void serializeSegmentTable (const SegmentTable& table, Bytes& out) {
    out.reserve(out.size() + table.size() * kRecordSize);
    auto sink = std::back_inserter(out);
    grammar::karma::generate(sink,
        grammar::SegmentTableGenerator<decltype(sink)>{}, table);
}

} // namespace fwpkg
