#include <gtest/gtest.h>
#include "../p21/cli.hpp"
#include "../lib/strbuf.h"
#include <stdio.h>
#include <string>
#include <vector>

using namespace p21;

class CliTest : public ::testing::Test {
protected:
    StrBuf* out = nullptr;
    StrBuf* err = nullptr;

    void SetUp() override {
        out = strbuf_new();
        err = strbuf_new();
    }

    void TearDown() override {
        strbuf_free(out);
        strbuf_free(err);
    }

    // runs "p21 <args...>" and captures both streams
    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "p21");
        std::vector<char*> argv;
        for (std::string& arg : args) {
            argv.push_back(&arg[0]);
        }
        argv.push_back(nullptr);
        return exec_command((int)args.size(), argv.data(), out, err);
    }

    std::string out_text() const { return std::string(out->str, out->length); }
    std::string err_text() const { return std::string(err->str, err->length); }
};

static const char* SAMPLE_DATA =
    "DATA;\n"
    "#1=CARTESIAN_POINT('origin',(0.,0.,0.));\n"
    "#2=DIRECTION('z',(0.,0.,1.));\n"
    "#3=DIRECTION('x',(1.,0.,0.));\n"
    "#4=AXIS2_PLACEMENT_3D('world',#1,#2,#3);\n"
    "#5=VERTEX_POINT('',#1);\n"
    "ENDSEC;\n"
    "END-ISO-10303-21;\n";

TEST_F(CliTest, EncodeWrapsInQuotes) {
    EXPECT_EQ(run({"encode", "O'Brien"}), 0);
    EXPECT_EQ(out_text(), "'O''Brien'\n");
    EXPECT_EQ(err_text(), "");
}

TEST_F(CliTest, EncodeNonAscii) {
    EXPECT_EQ(run({"encode", "caf\xC3\xA9"}), 0);
    EXPECT_EQ(out_text(), "'caf\\X\\E9'\n");
}

TEST_F(CliTest, EncodeInvalidBytes) {
    EXPECT_EQ(run({"encode", "ab\xFF"}), 1);
    EXPECT_EQ(out_text(), "");
    EXPECT_NE(err_text().find("error[E101]: cannot encode byte at offset 2"), std::string::npos) << err_text();
    EXPECT_NE(err_text().find("help: use --lenient"), std::string::npos);
}

TEST_F(CliTest, EncodeLenientDropsInvalidBytes) {
    EXPECT_EQ(run({"encode", "--lenient", "ab\xFF"}), 0);
    EXPECT_EQ(out_text(), "'ab'\n");
}

TEST_F(CliTest, EncodeArgumentErrors) {
    EXPECT_EQ(run({"encode"}), 1);
    EXPECT_NE(err_text().find("error[E105]: encode needs a text argument"), std::string::npos);

    EXPECT_EQ(run({"encode", "a", "b"}), 1);
    EXPECT_NE(err_text().find("unexpected argument 'b'"), std::string::npos);
    EXPECT_EQ(out_text(), "");
}

TEST_F(CliTest, DecodeStripsQuotes) {
    EXPECT_EQ(run({"decode", "'O''Brien'"}), 0);
    EXPECT_EQ(out_text(), "O'Brien\n");
}

TEST_F(CliTest, DecodeEscapes) {
    EXPECT_EQ(run({"decode", "caf\\X\\E9"}), 0);
    EXPECT_EQ(out_text(), "caf\xC3\xA9\n");
}

TEST_F(CliTest, DecodeMalformed) {
    EXPECT_EQ(run({"decode", "abc\\X2\\zz"}), 1);
    EXPECT_EQ(out_text(), "");
    EXPECT_NE(err_text().find("error[E104]: malformed escape at offset 3"), std::string::npos) << err_text();
}

TEST_F(CliTest, DecodeNeedsOneArgument) {
    EXPECT_EQ(run({"decode"}), 1);
    EXPECT_EQ(run({"decode", "a", "b"}), 1);
    EXPECT_NE(err_text().find("error[E105]"), std::string::npos);
}

TEST_F(CliTest, SampleToOutput) {
    EXPECT_EQ(run({"sample"}), 0);
    std::string text = out_text();
    EXPECT_EQ(text.rfind("ISO-10303-21;\nHEADER;\n", 0), 0u);
    EXPECT_NE(text.find("FILE_DESCRIPTION(('p21 sample'),'2;1');\n"), std::string::npos);
    EXPECT_NE(text.find("FILE_NAME('sample.stp','"), std::string::npos);
    EXPECT_NE(text.find("FILE_SCHEMA(('AUTOMOTIVE_DESIGN'));\n"), std::string::npos);
    EXPECT_NE(text.find(SAMPLE_DATA), std::string::npos) << text;
    EXPECT_EQ(err_text(), "");
}

TEST_F(CliTest, SampleToFile) {
    std::string path = ::testing::TempDir() + "p21_cli_sample.stp";
    remove(path.c_str());
    EXPECT_EQ(run({"sample", "-o", path}), 0);
    EXPECT_EQ(out_text(), "");

    std::string text;
    FILE* file = fopen(path.c_str(), "rb");
    ASSERT_NE(file, nullptr);
    char chunk[4096];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        text.append(chunk, n);
    }
    fclose(file);
    EXPECT_NE(text.find("FILE_NAME('" + path + "','"), std::string::npos);
    EXPECT_NE(text.find(SAMPLE_DATA), std::string::npos) << text;
    remove(path.c_str());
}

TEST_F(CliTest, SampleOptionErrors) {
    EXPECT_EQ(run({"sample", "--verbose"}), 1);
    EXPECT_NE(err_text().find("error[E105]: unknown option '--verbose'"), std::string::npos);

    EXPECT_EQ(run({"sample", "-o"}), 1);
    EXPECT_NE(err_text().find("-o needs a file name"), std::string::npos);

    EXPECT_EQ(run({"sample", "-o", "/nonexistent-p21-dir/out.stp"}), 1);
    EXPECT_NE(err_text().find("error[E404]"), std::string::npos) << err_text();
    EXPECT_EQ(out_text(), "");
}

TEST_F(CliTest, Help) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out_text().find("Usage:\n"), std::string::npos);
    EXPECT_EQ(err_text(), "");

    strbuf_free(out);
    out = strbuf_new();
    EXPECT_EQ(run({}), 0);
    EXPECT_NE(out_text().find("p21 sample"), std::string::npos);
}

TEST_F(CliTest, UnknownCommand) {
    EXPECT_EQ(run({"parse", "x.stp"}), 1);
    EXPECT_EQ(out_text(), "");
    EXPECT_NE(err_text().find("Usage:\n"), std::string::npos);
    EXPECT_NE(err_text().find("error[E105]: unknown command 'parse'"), std::string::npos);
}
