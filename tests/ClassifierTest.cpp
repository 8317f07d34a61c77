#include "Classifier.hpp"

#include <cctype>
#include <string>

#include <gtest/gtest.h>

namespace {

TEST(ClassifierTest, DefaultTableMapsKnownExtensions) {
    const Classifier classifier(Classifier::defaultTable());

    EXPECT_EQ(classifier.categoryFor(".jpg"), "images");
    EXPECT_EQ(classifier.categoryFor(".mkv"), "videos");
    EXPECT_EQ(classifier.categoryFor(".pdf"), "documents");
    EXPECT_EQ(classifier.categoryFor(".flac"), "audio");
    EXPECT_EQ(classifier.categoryFor(".7z"), "archives");
    EXPECT_EQ(classifier.categoryFor(".cpp"), "code");
}

TEST(ClassifierTest, LookupIsCaseInsensitive) {
    const Classifier classifier(Classifier::defaultTable());

    for (const auto& category : classifier.table()) {
        for (const auto& ext : category.extensions) {
            std::string upper = ext;
            for (auto& ch : upper) {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            EXPECT_EQ(classifier.categoryFor(upper), classifier.categoryFor(ext)) << ext;
            EXPECT_EQ(classifier.categoryFor(upper), category.label) << ext;
        }
    }
    EXPECT_EQ(classifier.categoryFor(".JPG"), classifier.categoryFor(".jpg"));
}

TEST(ClassifierTest, UnknownAndEmptyExtensionsFallBackToOthers) {
    const Classifier classifier(Classifier::defaultTable());

    EXPECT_EQ(classifier.categoryFor(".xyz"), "others");
    EXPECT_EQ(classifier.categoryFor(""), "others");
    EXPECT_EQ(classifier.categoryFor("."), "others");
    EXPECT_EQ(classifier.categoryForPath("README"), "others");
    EXPECT_EQ(classifier.categoryForPath(".bashrc"), "others");
}

TEST(ClassifierTest, PathLookupUsesLastExtension) {
    const Classifier classifier(Classifier::defaultTable());

    EXPECT_EQ(classifier.categoryForPath("/tmp/backup.tar.gz"), "archives");
    EXPECT_EQ(classifier.categoryForPath("Holiday.PNG"), "images");
}

TEST(ClassifierTest, ExtensionWithoutDotIsAccepted) {
    const Classifier classifier(Classifier::defaultTable());

    EXPECT_EQ(classifier.categoryFor("mp3"), "audio");
    EXPECT_EQ(classifier.categoryFor("MP3"), "audio");
}

TEST(ClassifierTest, WhitespaceInFileExtensionIsNotStripped) {
    const Classifier classifier(Classifier::defaultTable());

    EXPECT_EQ(classifier.categoryForPath("photo.j pg"), "others");
    EXPECT_EQ(classifier.categoryFor(".j pg"), "others");
    EXPECT_EQ(classifier.categoryFor(" .mp3"), "others");
}

TEST(ClassifierTest, ConfiguredExtensionsAreTrimmed) {
    const Classifier classifier({{"ebooks", {" EPUB ", ".mobi"}}});

    EXPECT_EQ(classifier.categoryFor(".epub"), "ebooks");
    EXPECT_EQ(classifier.categoryForPath("book.EPUB"), "ebooks");
}

TEST(ClassifierTest, FirstCategoryWinsOnOverlap) {
    const Classifier classifier({{"notes", {".txt"}}, {"documents", {".txt", ".pdf"}}});

    EXPECT_EQ(classifier.categoryFor(".txt"), "notes");
    EXPECT_EQ(classifier.categoryFor(".pdf"), "documents");
}

TEST(ClassifierTest, EmptyTableClassifiesEverythingAsOthers) {
    const Classifier classifier(CategoryTable{});

    EXPECT_EQ(classifier.categoryFor(".jpg"), "others");
}

TEST(ClassifierTest, NormalizeExtension) {
    EXPECT_EQ(Classifier::normalizeExtension("JPG"), ".jpg");
    EXPECT_EQ(Classifier::normalizeExtension(" .Tar "), ".tar");
    EXPECT_EQ(Classifier::normalizeExtension("   "), "");
}

} // namespace
