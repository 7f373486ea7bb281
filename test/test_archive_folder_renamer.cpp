#include "ArchiveFolderRenamer.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <string>

using test_support::expect;
using test_support::ScratchDir;
using test_support::ZipEntryContent;

namespace {

std::set<std::string> pathsOf(const std::map<std::string, ZipEntryContent>& entries) {
    std::set<std::string> paths;
    for (const auto& [path, content] : entries) {
        paths.insert(path);
    }
    return paths;
}

bool sameContents(const std::map<std::string, ZipEntryContent>& lhs, const std::map<std::string, ZipEntryContent>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [path, item] : lhs) {
        auto it = rhs.find(path);
        if (it == rhs.end() || it->second.content != item.content || it->second.directory != item.directory) {
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    test_support::useUtf8Locale();
    bool ok = true;

    ok = expect(renameEntryPath("Old/page01.jpg", false, "New") == "New/page01.jpg", "Expected file path prefix to change") && ok;
    ok = expect(renameEntryPath("Old/", true, "New") == "New/", "Expected directory entry to change") && ok;
    ok = expect(renameEntryPath("Old", true, "New") == "New/", "Expected bare directory entry to change") && ok;
    ok = expect(renameEntryPath("Old/sub/a.txt", false, "New") == "New/sub/a.txt", "Expected only the first segment to change") && ok;
    ok = expect(renameEntryPath("cover.jpg", false, "New") == "cover.jpg", "Expected top-level file to stay") && ok;

    {
        ScratchDir scratch("renamer_roundtrip");
        const auto zipPath = scratch.path() / "Foo第1巻.zip";
        ok = expect(test_support::writeZip(zipPath, {
                        {"Foo第1巻/", "", true},
                        {"Foo第1巻/page01.txt", "first page"},
                        {"Foo第1巻/extra/page02.txt", std::string(50000, 'x')},
                        {"Foo第1巻/empty.txt", ""},
                    }),
                    "Failed to create round-trip archive") && ok;

        bool readOk = false;
        const auto original = test_support::readZip(zipPath, readOk);
        ok = expect(readOk && original.size() == 4, "Expected to read the source archive") && ok;

        ok = expect(renameTopLevelFolder(zipPath, "FooBar第1巻"), "Expected rename to B to succeed") && ok;
        const auto renamed = test_support::readZip(zipPath, readOk);
        ok = expect(readOk, "Expected renamed archive to be readable") && ok;
        ok = expect(pathsOf(renamed) == std::set<std::string>{"FooBar第1巻/", "FooBar第1巻/page01.txt",
                                                                "FooBar第1巻/extra/page02.txt", "FooBar第1巻/empty.txt"},
                    "Expected every entry to move under the new folder") && ok;
        const auto page = renamed.find("FooBar第1巻/page01.txt");
        ok = expect(page != renamed.end() && page->second.content == "first page", "Expected entry content to be preserved") && ok;
        ok = expect(page != renamed.end() && page->second.mtime == test_support::kEntryTime,
                    "Expected entry timestamp to be preserved") && ok;
        ok = expect(!std::filesystem::exists(scratch.path() / "Foo第1巻.tmp"), "Expected no temporary file after success") && ok;

        ok = expect(renameTopLevelFolder(zipPath, "Foo第1巻"), "Expected rename back to A to succeed") && ok;
        const auto restored = test_support::readZip(zipPath, readOk);
        ok = expect(readOk && sameContents(original, restored), "Expected A -> B -> A to reproduce paths and contents") && ok;
    }

    {
        ScratchDir scratch("renamer_multiple_roots");
        const auto zipPath = scratch.path() / "mixed.zip";
        ok = expect(test_support::writeZip(zipPath, {
                        {"One/a.txt", "a"},
                        {"Two/b.txt", "b"},
                        {"readme.txt", "r"},
                    }),
                    "Failed to create mixed archive") && ok;

        ok = expect(renameTopLevelFolder(zipPath, "Merged"), "Expected rename of mixed archive to succeed") && ok;
        bool readOk = false;
        const auto renamed = test_support::readZip(zipPath, readOk);
        ok = expect(readOk && pathsOf(renamed) == std::set<std::string>{"Merged/a.txt", "Merged/b.txt", "readme.txt"},
                    "Expected each top-level folder to take the new name") && ok;
    }

    {
        ScratchDir scratch("renamer_methods_and_modes");
        const auto zipPath = scratch.path() / "Vol.zip";
        test_support::ZipEntrySpec folder{"Vol/", "", true};
        folder.perm = 0700;
        test_support::ZipEntrySpec cover{"Vol/cover.jpg", std::string(4096, 'c')};
        cover.stored = true;
        cover.perm = 0600;
        test_support::ZipEntrySpec notes{"Vol/notes.txt", std::string(4096, 'n')};
        ok = expect(test_support::writeZip(zipPath, {folder, cover, notes}), "Failed to create mixed-method archive") && ok;

        bool readOk = false;
        const auto original = test_support::readZip(zipPath, readOk);
        const auto originalCover = original.find("Vol/cover.jpg");
        const auto originalNotes = original.find("Vol/notes.txt");
        ok = expect(readOk && originalCover != original.end() && originalCover->second.stored &&
                        originalNotes != original.end() && !originalNotes->second.stored,
                    "Expected fixture to mix stored and deflated entries") && ok;

        ok = expect(renameTopLevelFolder(zipPath, "Renamed"), "Expected rename of mixed-method archive to succeed") && ok;
        const auto renamed = test_support::readZip(zipPath, readOk);
        ok = expect(readOk, "Expected mixed-method archive to stay readable") && ok;

        const auto renamedFolder = renamed.find("Renamed/");
        const auto renamedCover = renamed.find("Renamed/cover.jpg");
        const auto renamedNotes = renamed.find("Renamed/notes.txt");
        ok = expect(renamedFolder != renamed.end() && renamedFolder->second.perm == 0700,
                    "Expected directory permission bits to be preserved") && ok;
        ok = expect(renamedCover != renamed.end() && renamedCover->second.stored,
                    "Expected stored entry to stay stored") && ok;
        ok = expect(renamedCover != renamed.end() && renamedCover->second.perm == 0600,
                    "Expected file permission bits to be preserved") && ok;
        ok = expect(renamedCover != renamed.end() && renamedCover->second.content == std::string(4096, 'c'),
                    "Expected stored entry content to be preserved") && ok;
        ok = expect(renamedNotes != renamed.end() && !renamedNotes->second.stored,
                    "Expected deflated entry to stay compressed") && ok;
        ok = expect(renamedNotes != renamed.end() && renamedNotes->second.content == std::string(4096, 'n'),
                    "Expected deflated entry content to be preserved") && ok;
    }

    {
        ScratchDir scratch("renamer_invalid");
        const auto zipPath = scratch.path() / "broken.zip";
        test_support::writeTextFile(zipPath, "this is not a zip archive");

        ok = expect(!renameTopLevelFolder(zipPath, "Anything"), "Expected rename of a non-archive to fail") && ok;
        ok = expect(test_support::readTextFile(zipPath) == "this is not a zip archive", "Expected source to stay intact") && ok;
        ok = expect(!std::filesystem::exists(scratch.path() / "broken.tmp"), "Expected temporary file to be removed") && ok;
    }

    {
        ScratchDir scratch("renamer_missing");
        ok = expect(!renameTopLevelFolder(scratch.path() / "absent.zip", "Anything"), "Expected missing archive to fail") && ok;
        ok = expect(!std::filesystem::exists(scratch.path() / "absent.tmp"), "Expected no temporary file for missing archive") && ok;
    }

    {
        ScratchDir scratch("renamer_tmp_taken");
        const auto zipPath = scratch.path() / "Foo.zip";
        ok = expect(test_support::writeZip(zipPath, {{"Foo/a.txt", "a"}}), "Failed to create archive") && ok;
        test_support::writeTextFile(scratch.path() / "Foo.tmp", "unrelated");

        ok = expect(!renameTopLevelFolder(zipPath, "Bar"), "Expected rename to refuse an existing temporary name") && ok;
        ok = expect(test_support::readTextFile(scratch.path() / "Foo.tmp") == "unrelated", "Expected unrelated file to stay") && ok;
        bool readOk = false;
        const auto entries = test_support::readZip(zipPath, readOk);
        ok = expect(readOk && entries.count("Foo/a.txt") == 1, "Expected archive to stay unchanged") && ok;
    }

    if (!ok) {
        return 1;
    }

    std::cout << "Archive folder renamer tests passed" << std::endl;
    return 0;
}
