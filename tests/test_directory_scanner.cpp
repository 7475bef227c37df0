#include <QtTest/QtTest>

#include <QDir>
#include <QTemporaryDir>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "profiler/directory_scanner.hpp"
#include "profiler/snapshot_differ.hpp"

namespace {

void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

bool setMtime(const std::filesystem::path &path, time_t seconds, long nanos)
{
    struct timespec times[2];
    times[0].tv_sec = seconds;
    times[0].tv_nsec = nanos;
    times[1].tv_sec = seconds;
    times[1].tv_nsec = nanos;
    return utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) == 0;
}

std::vector<std::string> pathsOf(const buildprof::Snapshot &snapshot)
{
    std::vector<std::string> paths;
    for (const auto &record : snapshot.files) {
        paths.push_back(record.path);
    }
    return paths;
}

} // namespace

class DirectoryScannerTests : public QObject
{
    Q_OBJECT
private slots:
    void init();

    void testRecursiveRegularFilesSorted();
    void testCapturesSubSecondMtime();
    void testSkipsSymlinks();
    void testSkipsSpecialFiles();
    void testDoesNotTouchMtimes();
    void testParallelMatchesSerial();
    void testRelativeRootIsNormalized();
    void testMissingRootThrows();
    void testFileRootThrows();
    void testCancelledScanThrows();
    void testUnreadableSubdirectoryIsSkipped();
    void testVanishedFileIsSkipped();
    void testUnsearchableDirectoryFilesAreSkipped();
    void testExcludedDirectoryIsNotDescended();
    void testRescanOfUnchangedTreeIsEmptyDiff();
    void testRescanReportsCreatedAndModified();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;

    std::filesystem::path root() const
    {
        return std::filesystem::path(m_tempDir->path().toStdString());
    }
};

void DirectoryScannerTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
}

void DirectoryScannerTests::testRecursiveRegularFilesSorted()
{
    writeFile(root() / "b.txt", "b");
    writeFile(root() / "a.txt", "a");
    writeFile(root() / "src/main.o", "obj");
    writeFile(root() / "src/deep/nested/gen.h", "gen");
    std::filesystem::create_directories(root() / "empty");

    const auto snapshot = buildprof::scanDirectory(root().string());

    const std::vector<std::string> expected = {
        (root() / "a.txt").string(),
        (root() / "b.txt").string(),
        (root() / "src/deep/nested/gen.h").string(),
        (root() / "src/main.o").string(),
    };
    QCOMPARE(pathsOf(snapshot), expected);
    QCOMPARE(snapshot.root, root().string());
    QVERIFY(!snapshot.id.empty());
}

void DirectoryScannerTests::testCapturesSubSecondMtime()
{
    const auto file = root() / "obj.o";
    writeFile(file, "x");
    QVERIFY(setMtime(file, 1700000000, 123456789));

    const auto snapshot = buildprof::scanDirectory(root().string());
    QCOMPARE(snapshot.files.size(), size_t(1));
    QCOMPARE(snapshot.files.front().mtimeNs, int64_t(1700000000123456789LL));
}

void DirectoryScannerTests::testSkipsSymlinks()
{
    writeFile(root() / "real/file.txt", "data");
    std::filesystem::create_symlink(root() / "real/file.txt", root() / "link.txt");
    std::filesystem::create_directory_symlink(root() / "real", root() / "linkdir");

    const auto snapshot = buildprof::scanDirectory(root().string());

    const std::vector<std::string> expected = {(root() / "real/file.txt").string()};
    QCOMPARE(pathsOf(snapshot), expected);
}

void DirectoryScannerTests::testSkipsSpecialFiles()
{
    writeFile(root() / "regular", "x");
    QCOMPARE(mkfifo((root() / "pipe").c_str(), 0600), 0);

    const auto snapshot = buildprof::scanDirectory(root().string());

    const std::vector<std::string> expected = {(root() / "regular").string()};
    QCOMPARE(pathsOf(snapshot), expected);
}

void DirectoryScannerTests::testDoesNotTouchMtimes()
{
    const auto file = root() / "dir/stable.c";
    writeFile(file, "int main() {}");
    QVERIFY(setMtime(file, 1600000000, 0));
    QVERIFY(setMtime(root() / "dir", 1600000000, 0));

    buildprof::scanDirectory(root().string());

    struct stat st;
    QCOMPARE(::lstat(file.c_str(), &st), 0);
    QCOMPARE(static_cast<long long>(st.st_mtim.tv_sec), 1600000000LL);
    QCOMPARE(::lstat((root() / "dir").c_str(), &st), 0);
    QCOMPARE(static_cast<long long>(st.st_mtim.tv_sec), 1600000000LL);
}

void DirectoryScannerTests::testParallelMatchesSerial()
{
    for (int d = 0; d < 12; ++d) {
        for (int f = 0; f < 25; ++f) {
            const auto dir = root() / ("d" + std::to_string(d)) / ("sub" + std::to_string(f % 3));
            writeFile(dir / ("f" + std::to_string(f) + ".o"), std::to_string(d * f));
        }
    }

    buildprof::ScanOptions serial;
    serial.threads = 1;
    buildprof::ScanOptions parallel;
    parallel.threads = 8;

    const auto a = buildprof::scanDirectory(root().string(), serial);
    const auto b = buildprof::scanDirectory(root().string(), parallel);

    QCOMPARE(a.files.size(), size_t(12 * 25));
    QVERIFY(a.files == b.files);
}

void DirectoryScannerTests::testRelativeRootIsNormalized()
{
    writeFile(root() / "sub/x.txt", "x");
    const QString previous = QDir::currentPath();
    QVERIFY(QDir::setCurrent(m_tempDir->path()));

    const auto snapshot = buildprof::scanDirectory("./sub/");

    QVERIFY(QDir::setCurrent(previous));
    const auto canonical = std::filesystem::canonical(root() / "sub");
    QCOMPARE(snapshot.root, canonical.string());
    QCOMPARE(snapshot.files.size(), size_t(1));
    QCOMPARE(snapshot.files.front().path, (canonical / "x.txt").string());
}

void DirectoryScannerTests::testMissingRootThrows()
{
    const auto missing = root() / "does-not-exist";
    try {
        buildprof::scanDirectory(missing.string());
        QFAIL("expected ScanError");
    } catch (const buildprof::ScanError &error) {
        QVERIFY(error.kind() == buildprof::ScanError::Kind::RootUnreadable);
        QCOMPARE(error.path(), missing.string());
    }
}

void DirectoryScannerTests::testFileRootThrows()
{
    writeFile(root() / "plain.txt", "x");
    try {
        buildprof::scanDirectory((root() / "plain.txt").string());
        QFAIL("expected ScanError");
    } catch (const buildprof::ScanError &error) {
        QVERIFY(error.kind() == buildprof::ScanError::Kind::RootUnreadable);
    }
}

void DirectoryScannerTests::testCancelledScanThrows()
{
    writeFile(root() / "a/b.txt", "x");
    std::atomic<bool> cancel{true};
    buildprof::ScanOptions options;
    options.threads = 4;
    options.cancelFlag = &cancel;

    try {
        buildprof::scanDirectory(root().string(), options);
        QFAIL("expected ScanError");
    } catch (const buildprof::ScanError &error) {
        QVERIFY(error.kind() == buildprof::ScanError::Kind::Cancelled);
    }
}

void DirectoryScannerTests::testUnreadableSubdirectoryIsSkipped()
{
    if (geteuid() == 0) {
        QSKIP("permission bits are not enforced for root");
    }

    writeFile(root() / "ok.txt", "ok");
    writeFile(root() / "locked/hidden.txt", "hidden");
    QCOMPARE(::chmod((root() / "locked").c_str(), 0), 0);

    std::mutex mutex;
    std::vector<buildprof::ScanWarning> warnings;
    buildprof::ScanOptions options;
    options.onWarning = [&](const buildprof::ScanWarning &warning) {
        std::lock_guard<std::mutex> lock(mutex);
        warnings.push_back(warning);
    };

    const auto snapshot = buildprof::scanDirectory(root().string(), options);
    ::chmod((root() / "locked").c_str(), 0700);

    const std::vector<std::string> expected = {(root() / "ok.txt").string()};
    QCOMPARE(pathsOf(snapshot), expected);
    QCOMPARE(warnings.size(), size_t(1));
    QCOMPARE(warnings.front().path, (root() / "locked").string());
}

void DirectoryScannerTests::testVanishedFileIsSkipped()
{
    writeFile(root() / "keep.o", "k");
    writeFile(root() / "obj/temp.o", "t");
    writeFile(root() / "obj/stable.o", "s");
    const std::string vanishing = (root() / "obj/temp.o").string();

    std::mutex mutex;
    std::vector<buildprof::ScanWarning> warnings;
    buildprof::ScanOptions options;
    options.threads = 2;
    options.onFileFound = [&](const std::string &path) {
        if (path == vanishing) {
            std::filesystem::remove(path);
        }
    };
    options.onWarning = [&](const buildprof::ScanWarning &warning) {
        std::lock_guard<std::mutex> lock(mutex);
        warnings.push_back(warning);
    };

    const auto snapshot = buildprof::scanDirectory(root().string(), options);

    const std::vector<std::string> expected = {
        (root() / "keep.o").string(),
        (root() / "obj/stable.o").string(),
    };
    QCOMPARE(pathsOf(snapshot), expected);
    QCOMPARE(warnings.size(), size_t(1));
    QCOMPARE(warnings.front().path, vanishing);
    QVERIFY(!warnings.front().reason.empty());
}

void DirectoryScannerTests::testUnsearchableDirectoryFilesAreSkipped()
{
    if (geteuid() == 0) {
        QSKIP("permission bits are not enforced for root");
    }

    writeFile(root() / "ok.txt", "ok");
    writeFile(root() / "listonly/entry.txt", "entry");
    QCOMPARE(::chmod((root() / "listonly").c_str(), 0444), 0);

    std::vector<buildprof::ScanWarning> warnings;
    buildprof::ScanOptions options;
    options.onWarning = [&](const buildprof::ScanWarning &warning) {
        warnings.push_back(warning);
    };

    const auto snapshot = buildprof::scanDirectory(root().string(), options);
    ::chmod((root() / "listonly").c_str(), 0700);

    const std::vector<std::string> expected = {(root() / "ok.txt").string()};
    QCOMPARE(pathsOf(snapshot), expected);
    QCOMPARE(warnings.size(), size_t(1));
    QCOMPARE(warnings.front().path, (root() / "listonly/entry.txt").string());
}

void DirectoryScannerTests::testExcludedDirectoryIsNotDescended()
{
    writeFile(root() / "a.o", "a");
    writeFile(root() / "data/logs/tool.log", "log");
    writeFile(root() / "data2/b.o", "b");

    buildprof::ScanOptions options;
    options.excludedDirs = {(root() / "data/").string()};
    const auto snapshot = buildprof::scanDirectory(root().string(), options);

    const std::vector<std::string> expected = {
        (root() / "a.o").string(),
        (root() / "data2/b.o").string(),
    };
    QCOMPARE(pathsOf(snapshot), expected);
}

void DirectoryScannerTests::testRescanOfUnchangedTreeIsEmptyDiff()
{
    writeFile(root() / "a.txt", "a");
    writeFile(root() / "lib/b.o", "b");

    const auto first = buildprof::scanDirectory(root().string());
    const auto second = buildprof::scanDirectory(root().string());

    QVERIFY(buildprof::diffSnapshots(first, second).empty());
}

void DirectoryScannerTests::testRescanReportsCreatedAndModified()
{
    writeFile(root() / "a.txt", "a");
    writeFile(root() / "b.txt", "b");
    writeFile(root() / "gone.txt", "g");
    QVERIFY(setMtime(root() / "a.txt", 100, 0));
    QVERIFY(setMtime(root() / "b.txt", 100, 0));

    const auto before = buildprof::scanDirectory(root().string());

    writeFile(root() / "a.txt", "rewritten");
    QVERIFY(setMtime(root() / "a.txt", 200, 0));
    writeFile(root() / "c.txt", "c");
    QVERIFY(setMtime(root() / "c.txt", 150, 0));
    std::filesystem::remove(root() / "gone.txt");

    const auto after = buildprof::scanDirectory(root().string());
    const auto changes = buildprof::diffSnapshots(before, after);

    QCOMPARE(changes.size(), size_t(2));
    QCOMPARE(changes[0].path, (root() / "a.txt").string());
    QVERIFY(changes[0].kind == buildprof::ChangeKind::Modified);
    QCOMPARE(changes[0].newMtimeNs, int64_t(200) * 1000000000LL);
    QCOMPARE(changes[1].path, (root() / "c.txt").string());
    QVERIFY(changes[1].kind == buildprof::ChangeKind::Created);
    QCOMPARE(changes[1].newMtimeNs, int64_t(150) * 1000000000LL);
}

QTEST_MAIN(DirectoryScannerTests)
#include "test_directory_scanner.moc"
