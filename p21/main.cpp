#include "cli.hpp"
#include "../lib/log.h"
#include "../lib/strbuf.h"
#include <unistd.h>  // for access
#include <cstdio>

int main(int argc, char *argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            log_warn("failed to parse log.conf, using defaults");
        }
    }
    log_init("");  // Initialize with parsed config or defaults

    StrBuf* out = strbuf_new();
    StrBuf* err = strbuf_new();
    if (!out || !err) {
        fprintf(stderr, "error: out of memory\n");
        strbuf_free(out);
        strbuf_free(err);
        log_fini();
        return 1;
    }

    int rc = p21::exec_command(argc, argv, out, err);
    fwrite(out->str, 1, out->length, stdout);
    fwrite(err->str, 1, err->length, stderr);

    strbuf_free(out);
    strbuf_free(err);
    log_fini();
    return rc;
}
