#include <gtest/gtest.h>
#include <string>

#include "../p21/p21_error.h"
#include "../lib/strbuf.h"

static std::string format_error(const P21Error* error) {
    StrBuf* sb = strbuf_new();
    err_format(sb, error);
    std::string result(sb->str, sb->length);
    strbuf_free(sb);
    return result;
}

TEST(P21ErrorTest, CodeNames) {
    EXPECT_STREQ(err_code_name(ERR_OK), "OK");
    EXPECT_STREQ(err_code_name(ERR_UNREPRESENTABLE_CHARACTER), "UNREPRESENTABLE_CHARACTER");
    EXPECT_STREQ(err_code_name(ERR_CIRCULAR_REFERENCE), "CIRCULAR_REFERENCE");
    EXPECT_STREQ(err_code_name(ERR_FILE_WRITE_ERROR), "FILE_WRITE_ERROR");
    EXPECT_STREQ(err_code_name((P21ErrorCode)999), "UNKNOWN_ERROR");
}

TEST(P21ErrorTest, Categories) {
    EXPECT_STREQ(err_category_name(ERR_OK), "None");
    EXPECT_STREQ(err_category_name(ERR_INVALID_REAL), "Input");
    EXPECT_STREQ(err_category_name(ERR_CIRCULAR_REFERENCE), "Structure");
    EXPECT_STREQ(err_category_name(ERR_FILE_WRITE_ERROR), "I/O");
    EXPECT_STREQ(err_category_name(ERR_OUT_OF_MEMORY), "Internal");

    EXPECT_TRUE(ERR_IS_INPUT(ERR_NULL_REFERENCE));
    EXPECT_TRUE(ERR_IS_STRUCTURE(ERR_CIRCULAR_REFERENCE));
    EXPECT_FALSE(ERR_IS_IO(ERR_INTERNAL_ERROR));
}

TEST(P21ErrorTest, CreateWithDefaultMessage) {
    P21Error* error = err_create(ERR_NULL_REFERENCE, NULL);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->code, ERR_NULL_REFERENCE);
    EXPECT_STREQ(error->message, err_code_message(ERR_NULL_REFERENCE));
    EXPECT_EQ(error->help, nullptr);
    EXPECT_EQ(error->cause, nullptr);
    err_free(error);
}

TEST(P21ErrorTest, CreateFormatted) {
    P21Error* error = err_createf(ERR_INVALID_ESCAPE, "malformed escape at offset %zu", (size_t)12);
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error->message, "malformed escape at offset 12");
    EXPECT_EQ(format_error(error), "error[E104]: malformed escape at offset 12");
    err_free(error);
}

TEST(P21ErrorTest, HelpAndCauseChain) {
    P21Error* root = err_create(ERR_UNREPRESENTABLE_CHARACTER, "string value has no STEP encoding at byte 3");
    P21Error* error = err_create(ERR_UNREPRESENTABLE_CHARACTER, "cannot write entity PRODUCT");
    err_add_help(error, "use lenient encoding");
    err_set_cause(error, root);

    EXPECT_EQ(error->cause, root);
    EXPECT_EQ(format_error(error),
        "error[E101]: cannot write entity PRODUCT\n"
        "  help: use lenient encoding\n"
        "  caused by: error[E101]: string value has no STEP encoding at byte 3");
    err_free(error);  // frees the cause as well
}

TEST(P21ErrorTest, ReplacingHelp) {
    P21Error* error = err_create(ERR_IO_ERROR, NULL);
    err_add_help(error, "first");
    err_add_help(error, "second");
    EXPECT_STREQ(error->help, "second");
    err_free(error);
}

TEST(P21ErrorTest, NullSafety) {
    err_free(NULL);
    err_add_help(NULL, "help");
    err_set_cause(NULL, NULL);
    err_log(NULL);

    StrBuf* sb = strbuf_new();
    err_format(sb, NULL);
    EXPECT_EQ(sb->length, 0u);
    strbuf_free(sb);
}
