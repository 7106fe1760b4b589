#include <sys/stat.h>

#include "../src/validate/cpio.hpp"
#include "../src/validate/image_tree.hpp"
#include "archive_builder.hpp"
#include "test_framework.hpp"

using namespace rdinit;
using namespace rdinit::testing;

void test_cpio_parses_members() {
    ArchiveBuilder builder;
    builder.dir("./bin").file("./bin/hello", "hello world\n", 0755).chardev("dev/console", 5, 1);

    CpioArchive archive;
    std::string error;
    RD_ASSERT(parse_cpio(builder.bytes(), &archive, &error), "parse failed: " << error);
    RD_ASSERT_EQ(archive.entries.size(), 3u);
    RD_ASSERT_EQ(archive.entries[0].name, "bin");
    RD_ASSERT(S_ISDIR(archive.entries[0].mode), "directory mode");
    RD_ASSERT_EQ(archive.entries[1].name, "bin/hello");
    RD_ASSERT_EQ(archive.entries[1].data, "hello world\n");
    RD_ASSERT_EQ(archive.entries[2].rdev_major, 5u);
    RD_ASSERT_EQ(archive.entries[2].rdev_minor, 1u);
    RD_ASSERT(archive.trailing.empty(), "nothing after the trailer");
}

void test_cpio_concatenated_archives() {
    ArchiveBuilder early;
    early.dir("kernel").file("kernel/microcode.bin", "ucode");
    ArchiveBuilder main;
    main.dir("bin").file("init", "#!/bin/sh\n", 0755);

    CpioArchive archive;
    std::string error;
    RD_ASSERT(parse_cpio(early.bytes() + main.bytes(), &archive, &error),
              "parse failed: " << error);
    RD_ASSERT_EQ(archive.entries.size(), 4u);
    RD_ASSERT_EQ(archive.entries[3].name, "init");
}

void test_cpio_keeps_trailing_data() {
    ArchiveBuilder early;
    early.file("early.txt", "x");
    std::string compressed = "\x1f\x8b\x08 pretend gzip";

    CpioArchive archive;
    std::string error;
    RD_ASSERT(parse_cpio(early.bytes() + compressed, &archive, &error), "parse failed: " << error);
    RD_ASSERT_EQ(archive.entries.size(), 1u);
    RD_ASSERT_EQ(archive.trailing, compressed);
    RD_ASSERT(detect_compression(archive.trailing) == Compression::Gzip, "gzip magic");
}

void test_cpio_rejects_garbage() {
    CpioArchive archive;
    std::string error;
    RD_ASSERT(!parse_cpio(std::string(200, 'x'), &archive, &error), "garbage rejected");
    RD_ASSERT(error.find("bad magic") != std::string::npos, "error names the problem: " << error);

    ArchiveBuilder builder;
    builder.file("init", std::string(100, 'a'));
    std::string truncated = builder.bytes().substr(0, 150);
    CpioArchive partial;
    RD_ASSERT(!parse_cpio(truncated, &partial, &error), "truncated archive rejected");
}

void test_orphan_entries() {
    ArchiveBuilder builder;
    builder.file("bin/sh", "").dir("bin").dir("etc").file("etc/fstab", "").file("init", "");

    auto orphans = find_orphan_entries(builder.entries());
    RD_ASSERT_EQ(orphans.size(), 1u);
    RD_ASSERT_EQ(orphans[0], "bin/sh");
}

void test_compression_magic() {
    RD_ASSERT(detect_compression("070701000") == Compression::None, "newc");
    RD_ASSERT(detect_compression(std::string("\xfd" "7zXZ\0\0", 7)) == Compression::Xz, "xz");
    RD_ASSERT(detect_compression("BZh91AY") == Compression::Bzip2, "bzip2");
    RD_ASSERT(detect_compression("\x28\xb5\x2f\xfd") == Compression::Zstd, "zstd");
    RD_ASSERT(detect_compression("\x02\x21\x4c\x18") == Compression::Lz4, "lz4");
    RD_ASSERT(detect_compression("PK\x03\x04") == Compression::Unknown, "zip is not an initramfs");
}

RD_TEST_CASE(test_cpio_parses_members, "Cpio: newc members");
RD_TEST_CASE(test_cpio_concatenated_archives, "Cpio: concatenated archives");
RD_TEST_CASE(test_cpio_keeps_trailing_data, "Cpio: compressed data after trailer");
RD_TEST_CASE(test_cpio_rejects_garbage, "Cpio: garbage and truncation");
RD_TEST_CASE(test_orphan_entries, "Cpio: entries before their parent");
RD_TEST_CASE(test_compression_magic, "Cpio: compression detection");
