#include <libfwpkg/builder.hpp>
#include <libfwpkg/digest.hpp>
#include <libfwpkg/hash_table.hpp>
#include <libfwpkg/reader.hpp>
#include <libfwpkg/segment.hpp>
#include <libfwpkg/system_error.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

#include <boost/program_options.hpp>

#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = boost::filesystem;
namespace po = boost::program_options;

namespace {

const char kUsage [] =
    "Usage: fwpkg -f <package> <command>\n"
    "\n"
    "Commands:\n"
    "  create                                  write an empty package\n"
    "  print                                   describe a package\n"
    "  verify                                  check every digest\n"
    "  segment [-n INDEX] extract -s FILE      write a segment payload to FILE\n"
    "  segment [-n INDEX] insert -s FILE [-x ID]\n"
    "                                          insert FILE as a segment at INDEX\n"
    "  segment [-n INDEX] remove               remove the segment at INDEX\n";

struct CommandError : std::runtime_error {
    CommandError (std::string w) : std::runtime_error(w) {}
};

fwpkg::Bytes readFile (const fs::path& path) {
    fs::ifstream input{path, std::ios::in | std::ios::binary};
    if (!input) {
        throw CommandError{"failed to read from '" + path.string() + "'"};
    }
    return fwpkg::Bytes{std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}};
}

void writeFile (const fwpkg::Bytes& data, const fs::path& path) {
    fs::ofstream output{path, std::ios::out | std::ios::binary | std::ios::trunc};
    output.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!output) {
        throw CommandError{"failed to write to '" + path.string() + "'"};
    }
}

fwpkg::Package readPackageFile (const fs::path& path) {
    try {
        return fwpkg::readPackage(readFile(path));
    }
    catch (fwpkg::PackageError& e) {
        throw CommandError{"failed to parse package at '" + path.string() + "': "
            + e.code().message() + " (" + e.what() + ")"};
    }
}

std::unique_ptr<fwpkg::DigestProvider> makeProvider (const po::variables_map& vm) {
    if (vm.count("key") && !vm["key"].as<std::string>().empty()) {
        auto key = fwpkg::parseDigestKey(vm["key"].as<std::string>());
        return std::make_unique<fwpkg::HmacSha1DigestProvider>(std::move(key));
    }
    return std::make_unique<fwpkg::Sha1DigestProvider>();
}

uint64_t parseNumber (const std::string& text, const char* what) {
    auto value = fwpkg::parseSegmentNumber(text);
    if (!value) {
        throw CommandError{std::string("failed to parse ") + what + " '" + text
            + "': expected a decimal or 0x-prefixed hex number"};
    }
    return *value;
}

std::string describeSegment (fwpkg::SegmentId id) {
    auto name = fwpkg::knownSegmentName(id);
    if (name) {
        return *name;
    }
    auto ss = std::ostringstream();
    ss << "ID: 0x" << std::hex << id;
    return ss.str();
}

int printPackage (const fwpkg::Package& package, const fwpkg::DigestProvider& provider) {
    const auto& header = package.header();
    auto report = fwpkg::verify(package, provider);
    const auto& entries = report.entries();

    std::cout << "Package version: " << header.packageVersion << "\n"
        << "Image version: 0x" << std::hex << header.imageVersion << std::dec << "\n"
        << "Header length: " << header.headerLength << " bytes\n"
        << "Total length: " << header.totalLength << " bytes\n"
        << "Header digest: " << fwpkg::toHex(entries[0].expected)
        << (entries[0].passed ? "" : " (MISMATCH)") << "\n"
        << "[Segments]\n";

    const auto& table = package.segmentTable();
    for (auto i = std::size_t(0); i < table.size(); ++i) {
        const auto& entry = entries[i + 1];
        std::cout << "  [" << describeSegment(table[i].id) << "]\n"
            << "    Offset: 0x" << std::hex << table[i].offset << std::dec << "\n"
            << "    Size: " << table[i].size << " bytes\n"
            << "    Flags: 0x" << std::hex << table[i].flags << std::dec << "\n"
            << "    Hash digest: " << fwpkg::toHex(entry.expected)
            << (entry.passed ? "" : " (MISMATCH)") << "\n";
    }
    return 0;
}

int verifyPackage (const fwpkg::Package& package, const fwpkg::DigestProvider& provider) {
    auto report = fwpkg::verify(package, provider);
    for (auto&& failure : report.failures()) {
        if (failure.subject == fwpkg::VerificationEntry::Subject::HEADER) {
            std::cout << "header digest mismatch\n";
        }
        else {
            std::cout << "segment " << failure.index << " (" << describeSegment(failure.id)
                << ") digest mismatch\n";
        }
    }
    std::cout << (report.passed() ? "OK" : "FAILED") << "\n";
    return report.passed() ? 0 : 2;
}

int segmentCommand (const fs::path& packagePath, const std::vector<std::string>& command,
        const po::variables_map& vm, const fwpkg::DigestProvider& provider) {
    if (command.size() < 2) {
        throw CommandError{"missing segment subcommand"};
    }
    auto index = std::size_t(parseNumber(vm["index"].as<std::string>(), "segment index"));
    const auto& action = command[1];

    auto package = readPackageFile(packagePath);
    auto segments = fwpkg::segmentsOf(package);

    if (action == "extract") {
        if (!vm.count("segment")) {
            throw CommandError{"extract requires --segment"};
        }
        if (index >= segments.size()) {
            throw CommandError{"index '" + std::to_string(index) + "' is out-of-bounds"};
        }
        writeFile(segments[index].payload(), fs::path{vm["segment"].as<std::string>()});
        return 0;
    }

    if (action == "insert") {
        if (!vm.count("segment")) {
            throw CommandError{"insert requires --segment"};
        }
        if (index > segments.size()) {
            throw CommandError{"index '" + std::to_string(index) + "' is out-of-bounds"};
        }
        auto segmentPath = fs::path{vm["segment"].as<std::string>()};
        auto id = fwpkg::SegmentId(0);
        if (vm.count("id")) {
            id = parseNumber(vm["id"].as<std::string>(), "segment ID");
        }
        else if (auto known = fwpkg::segmentIdFromName(segmentPath.filename().string())) {
            id = *known;
        }
        segments.insert(segments.begin() + index, fwpkg::Segment{id, readFile(segmentPath)});
    }
    else if (action == "remove") {
        if (segments.empty()) {
            throw CommandError{"package has no segments"};
        }
        if (index >= segments.size()) {
            index = segments.size() - 1;
        }
        segments.erase(segments.begin() + index);
    }
    else {
        throw CommandError{"unknown segment subcommand '" + action + "'"};
    }

    auto rebuilt = fwpkg::buildPackage(std::move(segments), fwpkg::headerFieldsOf(package), provider);
    writeFile(rebuilt.bytes(), packagePath);
    return 0;
}

} // <anonymous>

int main (int argc, char** argv) try {
    boost::log::sources::logger lg;

    po::options_description options{"Options"};
    options.add_options()
        ("help,h", "show usage")
        ("file,f", po::value<std::string>(), "package file path")
        ("image-version,g", po::value<std::string>()->default_value("0"), "image version for create")
        ("index,n", po::value<std::string>()->default_value("0"), "segment index")
        ("segment,s", po::value<std::string>(), "segment file path")
        ("id,x", po::value<std::string>(), "segment ID for insert")
        ("key,k", po::value<std::string>(), "hex HMAC-SHA1 key (default: unkeyed SHA-1)")
        ("verbose,v", "log every codec stage")
        ("command", po::value<std::vector<std::string>>(), "command");
    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
        .options(options).positional(positional).run(), vm);
    // FWPKG_KEY supplies --key when it is not given on the command line.
    po::store(po::parse_environment(options, [](const std::string& name) -> std::string {
        return name == "FWPKG_KEY" ? "key" : "";
    }), vm);
    po::notify(vm);

    if (vm.count("help") || !vm.count("file") || !vm.count("command")) {
        std::cerr << kUsage << "\n" << options << "\n";
        return 1;
    }

    if (!vm.count("verbose")) {
        // Library records carry a Component attribute; only keep the tool's own.
        boost::log::core::get()->set_filter(
            !boost::log::expressions::has_attr<std::string>("Component"));
    }

    auto path = fs::path{vm["file"].as<std::string>()};
    auto command = vm["command"].as<std::vector<std::string>>();
    auto provider = makeProvider(vm);

    try {
        if (command[0] == "create") {
            auto fields = fwpkg::HeaderFields{};
            fields.imageVersion = parseNumber(vm["image-version"].as<std::string>(), "image version");
            writeFile(fwpkg::buildPackage({}, fields, *provider).bytes(), path);
            return 0;
        }
        if (command[0] == "print") {
            return printPackage(readPackageFile(path), *provider);
        }
        if (command[0] == "verify") {
            return verifyPackage(readPackageFile(path), *provider);
        }
        if (command[0] == "segment") {
            return segmentCommand(path, command, vm, *provider);
        }
        throw CommandError{"unknown command '" + command[0] + "'"};
    }
    catch (CommandError& e) {
        BOOST_LOG(lg) << "error: " << e.what();
        return 1;
    }
}
catch (std::exception& e) {
    boost::log::sources::logger lg;
    BOOST_LOG(lg) << "Exception in main: " << e.what();
    return 1;
}
