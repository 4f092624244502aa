#include <gtest/gtest.h>

#include "DataFlowExceptions.h"
#include "DatasetLoader.h"
#include "test_helpers.h"

// ============================================================================
// Source resolution and format selection
// ============================================================================

TEST(DatasetLoaderTest, MissingPathRaisesNoInput) {
    EXPECT_THROW(DatasetLoader::resolveSourceFile(dataPath("does_not_exist.csv")), DataFlow::NoInputException);
    EXPECT_THROW(DatasetLoader::resolveSourceFile(""), DataFlow::NoInputException);
}

TEST(DatasetLoaderTest, EmptyDirectoryRaisesNoInput) {
    TempDir dir;
    EXPECT_THROW(DatasetLoader::resolveSourceFile(dir.path.string()), DataFlow::NoInputException);
}

TEST(DatasetLoaderTest, DirectoryResolvesToFirstFileInLexicalOrder) {
    const std::string resolved = DatasetLoader::resolveSourceFile(dataPath("uploads"));
    EXPECT_EQ(std::filesystem::path(resolved).filename().string(), "a_first.csv");

    TabularDataset data = DatasetLoader().load(dataPath("uploads"));
    EXPECT_EQ(data.colCount(), 2u);
    EXPECT_EQ(data.columns()[0].name, "color");
}

TEST(DatasetLoaderTest, ExtensionsMapToFormats) {
    EXPECT_EQ(DatasetLoader::formatForPath("a.csv"), SourceFormat::DELIMITED_TEXT);
    EXPECT_EQ(DatasetLoader::formatForPath("a.TSV"), SourceFormat::DELIMITED_TEXT);
    EXPECT_EQ(DatasetLoader::formatForPath("a.txt"), SourceFormat::DELIMITED_TEXT);
    EXPECT_EQ(DatasetLoader::formatForPath("a.XLSX"), SourceFormat::XLSX);
    EXPECT_EQ(DatasetLoader::formatForPath("a.xls"), SourceFormat::XLS);
    EXPECT_THROW(DatasetLoader::formatForPath("a.json"), DataFlow::UnsupportedFormatException);
    EXPECT_THROW(DatasetLoader::formatForPath("noextension"), DataFlow::UnsupportedFormatException);
}

TEST(DatasetLoaderTest, UnsupportedFileRaisesBeforeReading) {
    EXPECT_THROW(DatasetLoader().load(dataPath("notes.json")), DataFlow::UnsupportedFormatException);
}

TEST(DatasetLoaderTest, UnsupportedFormatMapsToClientError) {
    try {
        DatasetLoader().load(dataPath("notes.json"));
        FAIL() << "expected UnsupportedFormatException";
    } catch (const DataFlow::UnsupportedFormatException& e) {
        EXPECT_EQ(e.statusCode(), 400);
        EXPECT_NE(std::string(e.what()).find("notes.json"), std::string::npos);
    }
}

// ============================================================================
// Delimiters and kind inference
// ============================================================================

TEST(DatasetLoaderTest, TsvUsesTabs) {
    TabularDataset data = DatasetLoader().load(dataPath("visits.tsv"));
    ASSERT_EQ(data.colCount(), 2u);
    EXPECT_EQ(data.rowCount(), 3u);
    EXPECT_EQ(data.columns()[0].kind, ColumnKind::TEXT);
    EXPECT_EQ(data.columns()[1].kind, ColumnKind::NUMERIC);
}

TEST(DatasetLoaderTest, TxtSniffsDelimiter) {
    TabularDataset data = DatasetLoader().load(dataPath("scores.txt"));
    ASSERT_EQ(data.colCount(), 2u);
    EXPECT_EQ(data.columns()[0].name, "team");
    EXPECT_EQ(data.cellText(1, 1), "7");
}

TEST(DatasetLoaderTest, ExplicitDelimiterOverridesExtension) {
    TempDir dir;
    const std::string path = dir.write("semi.csv", "a;b\n1;2\n");
    LoadOptions options;
    options.delimiter = ';';
    TabularDataset data = DatasetLoader(options).load(path);
    EXPECT_EQ(data.colCount(), 2u);
}

TEST(TabularDatasetTest, InfersKindsAndMissingTokens) {
    TabularDataset data = DatasetLoader().load(dataPath("sparse.csv"));
    ASSERT_EQ(data.colCount(), 5u);
    EXPECT_EQ(data.rowCount(), 6u);

    EXPECT_EQ(data.columns()[0].kind, ColumnKind::NUMERIC);
    EXPECT_TRUE(data.columns()[0].integral);
    EXPECT_EQ(data.columns()[1].kind, ColumnKind::TEXT);
    EXPECT_EQ(data.columns()[2].kind, ColumnKind::NUMERIC);
    EXPECT_FALSE(data.columns()[2].integral);
    EXPECT_EQ(data.columns()[3].kind, ColumnKind::DATETIME);
    EXPECT_EQ(data.columns()[4].kind, ColumnKind::UNKNOWN);

    EXPECT_TRUE(data.isMissing(2, 3));   // NA
    EXPECT_TRUE(data.isMissing(3, 4));   // n/a
    EXPECT_TRUE(data.isMissing(1, 1));   // empty
    EXPECT_EQ(data.cellText(3, 0), "2023-01-04T00:00:00");
    EXPECT_EQ(data.cellText(2, 1), "78.0");
}

TEST(TabularDatasetTest, ShortRowsArePadded) {
    TabularDataset data = datasetFromCsv("a,b,c\n1,2\n5,6,7\n");
    EXPECT_EQ(data.rowCount(), 2u);
    EXPECT_TRUE(data.isMissing(2, 0));
    EXPECT_EQ(data.cellText(2, 1), "7");
}

TEST(TabularDatasetTest, RowWithExtraFieldsIsRejected) {
    try {
        datasetFromCsv("a,b,c\n1,2,3\n1,2,3,4\n5,6,7\n");
        FAIL() << "expected DatasetException";
    } catch (const DataFlow::DatasetException& e) {
        EXPECT_EQ(e.statusCode(), 400);
        const std::string what = e.what();
        EXPECT_NE(what.find("Expected 3 fields in data row 2"), std::string::npos) << what;
        EXPECT_NE(what.find("saw 4"), std::string::npos) << what;
    }
}

TEST(TabularDatasetTest, UnterminatedQuoteIsRejected) {
    EXPECT_THROW(datasetFromCsv("a,b\n1,\"open\n"), DataFlow::DatasetException);
}

// ============================================================================
// Text encoding
// ============================================================================

TEST(TabularDatasetTest, Latin1CellIsRejectedWithPosition) {
    TempDir dir;
    const std::string path = dir.write("latin1.csv", "city,code\nZ\xFCrich,a\nK\xF6ln,b\n");
    try {
        DatasetLoader().load(path);
        FAIL() << "expected DatasetException";
    } catch (const DataFlow::DatasetException& e) {
        EXPECT_EQ(e.statusCode(), 400);
        const std::string what = e.what();
        EXPECT_NE(what.find("not valid UTF-8"), std::string::npos) << what;
        EXPECT_NE(what.find("0xFC"), std::string::npos) << what;
        EXPECT_NE(what.find("data row 1, column 'city'"), std::string::npos) << what;
    }
}

TEST(TabularDatasetTest, Latin1HeaderIsRejected) {
    EXPECT_THROW(datasetFromCsv("caf\xE9,n\nx,1\n"), DataFlow::DatasetException);
}

TEST(TabularDatasetTest, MultiByteUtf8IsKeptIntact) {
    TabularDataset data = datasetFromCsv("city,\xE2\x82\xAC\nZ\xC3\xBCrich,1\n\xE6\x9D\xB1\xE4\xBA\xAC,2\n");
    ASSERT_EQ(data.colCount(), 2u);
    EXPECT_EQ(data.columns()[1].name, "\xE2\x82\xAC");
    EXPECT_EQ(data.cellText(0, 0), "Z\xC3\xBCrich");
    EXPECT_EQ(data.cellText(0, 1), "\xE6\x9D\xB1\xE4\xBA\xAC");
}

TEST(TabularDatasetTest, EmptyInputHasNoHeader) {
    EXPECT_THROW(datasetFromCsv(""), DataFlow::DatasetException);
}

TEST(TabularDatasetTest, FormatNumber) {
    EXPECT_EQ(TabularDataset::formatNumber(12.0, true), "12");
    EXPECT_EQ(TabularDataset::formatNumber(12.0, false), "12.0");
    EXPECT_EQ(TabularDataset::formatNumber(0.25, false), "0.25");
}

TEST(TabularDatasetTest, AppendColumnRejectsLengthMismatch) {
    TabularDataset data = datasetFromCsv("a\n1\n2\n");
    TypedColumn col;
    col.name = "b";
    col.kind = ColumnKind::TEXT;
    col.values = std::vector<std::string>{"x"};
    col.missing = {0};
    EXPECT_THROW(data.appendColumn(col), DataFlow::DatasetException);
}
