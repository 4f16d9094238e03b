#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include "TestUtils.hpp"
#include "calibset/Errors.hpp"
#include "calibset/PathCollector.hpp"

using calib::PathCollector;

int main() {
    std::cout << "[Test] Starting PathCollector Test..." << std::endl;

    fs::path root = testutil::makeTempDir("collector");
    testutil::writeImage(root / "b.jpg", 8, 8, 1);
    testutil::writeImage(root / "A.JPG", 8, 8, 2);
    testutil::writeImage(root / "nested" / "deeper" / "c.Jpeg", 8, 8, 3);
    testutil::writeImage(root / "nested" / "d.PNG", 8, 8, 4);
    testutil::writeBytes(root / "notes.txt", "not an image");
    testutil::writeBytes(root / "nested" / "e.bmp", "ignored by default");
    fs::create_directories(root / "dir.jpg");   // a directory is never an image

    PathCollector collector;
    calib::Corpus corpus = collector.collect(root);

    assert(corpus.size() == 4);
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        assert(corpus[i].is_absolute());
        assert(fs::is_regular_file(corpus[i]));
        if (i > 0) assert(corpus[i - 1].string() < corpus[i].string());
    }
    const fs::path abs_root = fs::absolute(root).lexically_normal();
    assert(corpus[0] == abs_root / "A.JPG");
    assert(corpus[1] == abs_root / "b.jpg");

    // Same tree through a non-normal root: identical corpus, each file once.
    calib::Corpus again = collector.collect(root / "nested" / "..");
    assert(again == corpus);

    // Extensions are case-insensitive and normalized.
    PathCollector custom({"BMP", ".Png", ".png"});
    assert(custom.extensions().size() == 2);
    calib::Corpus other = custom.collect(root);
    assert(other.size() == 2);
    assert(other[0].filename() == "d.PNG");
    assert(other[1].filename() == "e.bmp");

    // An output directory inside the tree is not a source of candidates.
    fs::path nested_out = root / "nested" / "calibration_images";
    testutil::writeImage(nested_out / "calib_000000.jpg", 8, 8, 5);
    testutil::writeImage(nested_out / "keep_me_out.jpg", 8, 8, 6);
    assert(collector.collect(root).size() == 6);
    PathCollector skipping;
    skipping.exclude(nested_out);
    assert(skipping.collect(root) == corpus);

    // Output directory == source root: only our own canonical names drop out.
    testutil::writeImage(root / "calib_000001.jpg", 8, 8, 7);
    PathCollector in_place;
    in_place.exclude(root);
    calib::Corpus in_place_corpus = in_place.collect(root);
    assert(in_place_corpus.size() == 6);
    for (const auto& p : in_place_corpus) {
        assert(p.filename() != "calib_000001.jpg");
    }
    fs::remove(root / "calib_000001.jpg");
    fs::remove_all(nested_out);

    bool threw = false;
    try {
        collector.collect(root / "missing");
    } catch (const calib::NotFoundError&) {
        threw = true;
    }
    assert(threw && "missing root must raise NotFoundError");

    threw = false;
    try {
        collector.collect(root / "notes.txt");
    } catch (const calib::NotADirectoryError&) {
        threw = true;
    }
    assert(threw && "file root must raise NotADirectoryError");

    fs::path empty = testutil::makeTempDir("collector_empty");
    testutil::writeBytes(empty / "readme.md", "# nothing here");
    threw = false;
    try {
        collector.collect(empty);
    } catch (const calib::EmptyCorpusError&) {
        threw = true;
    }
    assert(threw && "no matches must raise EmptyCorpusError");

    fs::remove_all(root);
    fs::remove_all(empty);
    std::cout << "[PASS] PathCollector Test." << std::endl;
    return 0;
}
