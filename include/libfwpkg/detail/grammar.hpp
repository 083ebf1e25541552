#ifndef LIBFWPKG_DETAIL_GRAMMAR_HPP
#define LIBFWPKG_DETAIL_GRAMMAR_HPP

#include <libfwpkg/header.hpp>
#include <libfwpkg/segment_table.hpp>

#include <boost/spirit/include/karma.hpp>
#include <boost/spirit/include/karma_binary.hpp>
#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/qi_binary.hpp>

#include <cstddef>

namespace fwpkg { namespace grammar {

namespace qi = boost::spirit::qi;
namespace karma = boost::spirit::karma;

// Spirit.Qi parsers for the fixed-width sections of a package. Every field is
// a big-endian 64-bit word, so a record is just a run of big_qwords adapted
// onto the corresponding Fusion sequence. The magic is checked by the caller
// before the header fields are handed to these rules.
template <class Iter>
struct HeaderParser : qi::grammar<Iter, Header()> {
    qi::rule<Iter, Header()> start;

    HeaderParser () : HeaderParser::base_type(start, "header") {
        start.name("header");
        start = qi::big_qword   // package version
            >> qi::big_qword    // image version
            >> qi::big_qword    // segment count
            >> qi::big_qword    // header length
            >> qi::big_qword;   // total length
    }
};

// The segment table inherits its record count.
template <class Iter>
struct SegmentTableParser : qi::grammar<Iter, SegmentTable(std::size_t)> {
    qi::rule<Iter, SegmentTable(std::size_t)> start;
    qi::rule<Iter, SegmentEntry()> record;

    SegmentTableParser () : SegmentTableParser::base_type(start, "segmentTable") {
        using qi::_r1;

        start.name("segmentTable");
        start = qi::repeat(_r1)[record];

        record.name("record");
        record = qi::big_qword  // id
            >> qi::big_qword    // offset
            >> qi::big_qword    // size
            >> qi::big_qword;   // flags
    }
};

// Spirit.Karma generators, the inverse of the parsers above.
template <class OutIter>
struct HeaderGenerator : karma::grammar<OutIter, Header()> {
    karma::rule<OutIter, Header()> start;

    HeaderGenerator () : HeaderGenerator::base_type(start, "header") {
        start = karma::big_qword
            << karma::big_qword
            << karma::big_qword
            << karma::big_qword
            << karma::big_qword;
    }
};

template <class OutIter>
struct SegmentTableGenerator : karma::grammar<OutIter, SegmentTable()> {
    karma::rule<OutIter, SegmentTable()> start;
    karma::rule<OutIter, SegmentEntry()> record;

    SegmentTableGenerator () : SegmentTableGenerator::base_type(start, "segmentTable") {
        start = *record;
        record = karma::big_qword
            << karma::big_qword
            << karma::big_qword
            << karma::big_qword;
    }
};

}} // fwpkg::grammar

#endif
