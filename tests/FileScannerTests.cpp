#include "FileScanner.hpp"
#include "TimeUtils.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace TestSupport;

namespace
{
    std::vector<std::string> RelativePaths(const std::vector<FileDescriptor>& Files)
    {
        std::vector<std::string> Paths;
        for (const auto& File : Files)
        {
            Paths.push_back(File.RelativePath);
        }
        return Paths;
    }

    class FileScannerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            WriteFile(Dir / "A001/CLIP/A001C001.mov", MakeBytes(100, 1));
            WriteFile(Dir / "A001/CLIP/A001C002.mov", MakeBytes(250, 2));
            WriteFile(Dir / "A001/PROXY/A001C001.mp4", MakeBytes(10, 3));
            WriteText(Dir / "A001/card.xml", "<card/>");
            Card = Dir / "A001";
        }

        TempDir Dir;
        std::string Card;
        FileScanner Scanner;
    };
}

TEST(ResolvePathTemplate, ReplacesEveryToken)
{
    DestinationLayout Layout;
    Layout.ProjectName = "Feature";
    Layout.CameraID = "B";
    Layout.CardNumber = 7;

    std::time_t Now = std::time(nullptr);
    std::string Date = FormatLocalTime("%Y-%m-%d", Now);

    EXPECT_EQ(ResolvePathTemplate("{project_name}/{date_yyyy-mm-dd}/{camera_id}{card_num}_{source_name}", Layout, "A001", Now),
              "Feature/" + Date + "/B007_A001");
    EXPECT_EQ(ResolvePathTemplate("{date_yyyymmdd}", Layout, "x", Now), FormatLocalTime("%Y%m%d", Now));
    EXPECT_EQ(ResolvePathTemplate("{date_yy-mm-dd}", Layout, "x", Now), FormatLocalTime("%y-%m-%d", Now));
    EXPECT_EQ(ResolvePathTemplate("{card_num}-{card_num}", Layout, "x", Now), "007-007");
    EXPECT_EQ(ResolvePathTemplate("plain/{unknown}", Layout, "x", Now), "plain/{unknown}");
}

TEST_F(FileScannerTest, SourceFolderLayoutIsSortedAndComplete)
{
    Scanner.Scan(Card);
    const auto& Files = Scanner.GetFiles();

    EXPECT_EQ(RelativePaths(Files), (std::vector<std::string>{
        "A001/CLIP/A001C001.mov",
        "A001/CLIP/A001C002.mov",
        "A001/PROXY/A001C001.mp4",
        "A001/card.xml" }));

    ASSERT_EQ(Files.size(), 4u);
    EXPECT_EQ(Files[1].Size, 250u);
    EXPECT_EQ(Files[1].SourceRoot, Card);
    EXPECT_EQ(Files[1].SourcePath, Dir / "A001/CLIP/A001C002.mov");
    EXPECT_GT(Files[1].MTime, 0);
    EXPECT_FALSE(Files[1].Checksum.has_value());
}

TEST_F(FileScannerTest, FlatLayoutAndExcludes)
{
    DestinationLayout Layout;
    Layout.CreateSourceFolder = false;
    Scanner.SetLayout(Layout);
    Scanner.SetExcludes({ Dir / "A001/PROXY", Dir / "A001/card.xml" });

    Scanner.Scan(Card + "/");
    EXPECT_EQ(RelativePaths(Scanner.GetFiles()), (std::vector<std::string>{ "CLIP/A001C001.mov", "CLIP/A001C002.mov" }));
}

TEST_F(FileScannerTest, TemplateLayoutPrefixesEveryFile)
{
    DestinationLayout Layout;
    Layout.Template = "{project_name}/{camera_id}{card_num}";
    Layout.ProjectName = "Doc";
    Layout.CameraID = "A";
    Layout.CardNumber = 12;
    Scanner.SetLayout(Layout);

    Scanner.Scan(Card);
    ASSERT_EQ(Scanner.GetFiles().size(), 4u);
    for (const auto& File : Scanner.GetFiles())
    {
        EXPECT_EQ(File.RelativePath.rfind("Doc/A012/", 0), 0u) << File.RelativePath;
    }
}

TEST_F(FileScannerTest, SingleFileSource)
{
    Scanner.Scan(Dir / "A001/card.xml");
    ASSERT_EQ(Scanner.GetFiles().size(), 1u);
    EXPECT_EQ(Scanner.GetFiles()[0].RelativePath, "card.xml");
    EXPECT_EQ(Scanner.GetFiles()[0].Size, 7u);
}

TEST_F(FileScannerTest, SymlinksAndMissingRootsAreSkipped)
{
    FS::create_symlink(Dir / "A001/card.xml", Dir / "A001/link.xml");

    Scanner.Scan(Dir / "does-not-exist");
    EXPECT_TRUE(Scanner.GetFiles().empty());

    Scanner.Scan(Card);
    EXPECT_EQ(Scanner.GetFiles().size(), 4u);

    Scanner.Clear();
    EXPECT_TRUE(Scanner.GetFiles().empty());
}

TEST_F(FileScannerTest, ExcludedRootYieldsNothing)
{
    Scanner.SetExcludes({ Card });
    Scanner.Scan(Card);
    EXPECT_TRUE(Scanner.GetFiles().empty());
}
