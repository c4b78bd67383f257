#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "core/recon_engine.hpp"
#include "ingest/csv_reader.hpp"
#include "persist/csv_writer.hpp"

namespace {

TEST(CsvWriterTest, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(persist::escape_csv_cell("plain"), "plain");
    EXPECT_EQ(persist::escape_csv_cell("a,b"), "\"a,b\"");
    EXPECT_EQ(persist::escape_csv_cell("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(persist::escape_csv_cell("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(persist::escape_csv_cell(""), "");
}

TEST(CsvWriterTest, AppendsStatusColumnKeepingOriginalCells) {
    core::Table source;
    source.headers = {"Job No", "PO Number", "Style Ref No", "Color", "ExFactory Qty"};
    source.rows = {{"J1", "100", "S", "C", "120"}};
    core::Table target;
    target.headers = {"Job No", "PO Number", "Style Ref No", "Color", "Ship Qty", "Remarks"};
    target.rows = {{"j1", " 100 ", "s", "c", "150", "rush, air"}, {"J2", "999", "X", "Y", "1", ""}};

    const auto run = core::run_recon(source, target, core::default_recon_config());
    ASSERT_TRUE(run.ok()) << run.message;

    std::ostringstream out;
    persist::write_annotated_csv(out, target, run.demand);
    EXPECT_EQ(out.str(),
              "Job No,PO Number,Style Ref No,Color,Ship Qty,Remarks,Status\n"
              "j1, 100 ,s,c,150,\"rush, air\",Over Shipment (PO Match: 120 vs 150)\n"
              "J2,999,X,Y,1,,No Match Found\n");
}

TEST(CsvWriterTest, ExistingStatusColumnIsOverwritten) {
    core::Table target;
    target.headers = {"PO Number", " STATUS ", "Ship Qty"};
    target.rows = {{"100", "Ok (PO Match)", "5"}, {"200", "stale", "1"}};
    core::DemandBatch demand;
    demand.records.resize(2);
    demand.records[0].row_index = 0;
    demand.records[0].outcome.kind = core::OutcomeKind::NoMatchFound;
    demand.records[1].row_index = 1;
    demand.records[1].outcome.kind = core::OutcomeKind::NoMatchBuyer;

    std::ostringstream out;
    persist::write_annotated_csv(out, target, demand);
    EXPECT_EQ(out.str(),
              "PO Number, STATUS ,Ship Qty\n"
              "100,No Match Found,5\n"
              "200,No Match Found (Buyer-Specific),1\n");
}

TEST(CsvWriterTest, WrittenFileReadsBack) {
    core::Table target;
    target.headers = {"PO Number"};
    target.rows = {{"1"}};
    core::DemandBatch demand;
    demand.records.emplace_back();
    demand.records[0].outcome.kind = core::OutcomeKind::NoMatchFound;

    const auto path = std::filesystem::temp_directory_path() / "export_recon_csv_writer_test.csv";
    std::string error;
    ASSERT_TRUE(persist::write_annotated_csv(path, target, demand, error)) << error;

    core::Table back;
    ASSERT_TRUE(ingest::load_csv(path, back, error)) << error;
    EXPECT_EQ(back.headers, (std::vector<std::string>{"PO Number", "Status"}));
    EXPECT_EQ(back.cell(0, 1), "No Match Found");
    std::filesystem::remove(path);
}

TEST(CsvWriterTest, UnwritablePathReportsError) {
    core::Table target;
    core::DemandBatch demand;
    std::string error;
    EXPECT_FALSE(persist::write_annotated_csv("/nonexistent/dir/out.csv", target, demand, error));
    EXPECT_NE(error.find("Failed to open output file"), std::string::npos);
}

} // namespace
