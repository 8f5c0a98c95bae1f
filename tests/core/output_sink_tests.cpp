#include "expect.hpp"
#include "test_files.hpp"

#include <vargen/error.h>
#include <vargen/output_sink.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

using vargen::OutputSink;
using vargen::test::read_file;
using vargen::test::write_file;

int main() {
    vargen::test::Run t;

    {
        std::ostringstream       out;
        OutputSink               sink(out, "\n");
        const std::vector<std::string> first{"a", "b"};
        const std::vector<std::string> second{"c"};
        sink.write_batch(first);
        sink.write_batch(second);
        sink.write_batch({});
        t.expect(out.str() == "a\nb\nc", "separator between items and across batches, none trailing");
        t.expect(sink.items_written() == 3 && sink.batches_written() == 2, "counters skip empty batches");
        t.expect(sink.bytes_written() == 5, "bytes counted");
    }

    {
        std::ostringstream out;
        OutputSink         sink(out, "-", true);
        sink.write_batch(std::vector<std::string>{"x", "y"});
        t.expect(out.str() == "-x-y", "leading separator before the first item only");
    }

    {
        std::ostringstream out;
        OutputSink         sink(out, "");
        sink.write_batch(std::vector<std::string>{"ab", "", "cd"});
        t.expect(out.str() == "abcd", "empty separator concatenates");
    }

    {
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        OutputSink sink(out, "\n");
        t.expect(vargen::test::throws_as<vargen::error>([&] { sink.write_batch(std::vector<std::string>{"a"}); },
                                                        [](const vargen::error &e) { return e.kind() == vargen::ErrorKind::IOFailure; }),
                 "a bad stream is an IOFailure");
    }

    // A stream failure that set no errno must not borrow an earlier one.
    {
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        vargen::OutputSink sink(out, "\n");
        std::string        message;
        errno = ENOSPC;
        t.expect(vargen::test::throws_as<vargen::error>([&] { sink.write_batch(std::vector<std::string>{"a"}); },
                                                        [&](const vargen::error &e) {
                                                            message = e.what();
                                                            return e.kind() == vargen::ErrorKind::IOFailure;
                                                        }),
                 "bad stream with leftover errno is an IOFailure");
        t.expect(message.find("unknown error") != std::string::npos, "write failure without errno says unknown error: " + message);
        t.expect(message.find(std::strerror(ENOSPC)) == std::string::npos, "leftover errno is not reported: " + message);
    }

    vargen::test::ScratchDir dir("output_sink_tests_tmp");
    {
        const auto path = dir.path("existing.txt");
        t.expect(!vargen::append_needs_separator(dir.path("missing.txt"), "-"), "missing file needs no separator");
        write_file(path, "");
        t.expect(!vargen::append_needs_separator(path, "-"), "empty file needs no separator");
        write_file(path, "PRE");
        t.expect(vargen::append_needs_separator(path, "-"), "content without trailing separator needs one");
        t.expect(!vargen::append_needs_separator(path, ""), "empty separator never needs inserting");
        write_file(path, "PRE-");
        t.expect(!vargen::append_needs_separator(path, "-"), "content ending with the separator needs none");
        write_file(path, "P");
        t.expect(vargen::append_needs_separator(path, "---"), "content shorter than the separator needs one");
        write_file(path, "line\r\n");
        t.expect(!vargen::append_needs_separator(path, "\r\n"), "multi-character separator suffix is detected");
    }

    // Character devices and pipes are written to as-is.
    if (std::filesystem::exists("/dev/null")) {
        bool needs = true;
        t.expect(!vargen::test::throws_as<vargen::error>([&] { needs = vargen::append_needs_separator("/dev/null", "-"); }),
                 "a device destination does not fail the append check");
        t.expect(!needs, "a device destination needs no separator");
    }

    {
        const auto path = dir.path("nested/dir/out.txt");
        {
            auto file = vargen::open_output_file(path, false);
            file << "first";
        }
        t.expect(read_file(path) == "first", "parent directories are created");
        {
            auto file = vargen::open_output_file(path, true);
            file << "+more";
        }
        t.expect(read_file(path) == "first+more", "append keeps existing content");
        {
            auto file = vargen::open_output_file(path, false);
            file << "new";
        }
        t.expect(read_file(path) == "new", "overwrite truncates");
    }

    t.expect(vargen::test::throws_as<vargen::error>([&] { (void)vargen::open_output_file(dir.path("nested"), false); },
                                                    [](const vargen::error &e) { return e.kind() == vargen::ErrorKind::IOFailure; }),
             "opening a directory as the output is an IOFailure");

    return t.finish();
}
