#include "test_common.h"
#include "scrapeguard/proc.h"

#include <atomic>
#include <string>
#include <vector>

#include <pthread.h>
#include <signal.h>

using namespace scrapeguard;

static ProcLimits test_limits() {
    ProcLimits lim;
    lim.timeout_ms = 5000;
    lim.stdout_max_bytes = 2 * 1024 * 1024;
    lim.rlimit_cpu_sec = 4;
    lim.rlimit_as_mb = 0;
    lim.rlimit_nproc = 0;
    return lim;
}

int main() {
    // split_argv_quoted
    {
        auto v = split_argv_quoted("gen --model 'big one' \"a \\\"b\\\"\"");
        expect_eq_ll((long long)v.size(), 4, "four tokens");
        expect_true(v[0] == "gen" && v[1] == "--model", "plain tokens");
        expect_true(v[2] == "big one", "single quotes keep spaces");
        expect_true(v[3] == "a \"b\"", "escaped double quotes");
        expect_true(split_argv_quoted("broken 'quote").empty(), "unterminated quote is a parse error");
        auto e = split_argv_quoted("run ''");
        expect_eq_ll((long long)e.size(), 2, "empty quoted token kept");
    }

    // stdout capture and exit code
    {
        ProcResult pr;
        bool started = proc_run_capture_sandboxed({"/bin/sh", "-c", "echo hello; exit 3"}, "", test_limits(), &pr);
        expect_true(started, "sh should start");
        expect_true(pr.output == "hello\n", "captured stdout: " + pr.output);
        expect_eq_ll(pr.exit_code, 3, "exit code");
        expect_true(!pr.timed_out && !pr.cancelled, "no timeout or cancel");
    }

    // stderr dropped when not merged
    {
        ProcLimits lim = test_limits();
        lim.merge_stderr = false;
        ProcResult pr;
        proc_run_capture_sandboxed({"/bin/sh", "-c", "echo err 1>&2; echo out"}, "", lim, &pr);
        expect_true(pr.output == "out\n", "stderr not captured: " + pr.output);
    }

    // stdin larger than a pipe buffer round-trips through cat
    {
        std::string payload(300 * 1024, 'x');
        for (size_t i = 0; i < payload.size(); i += 97) payload[i] = (char)('a' + (i % 26));
        ProcResult pr;
        bool started = proc_run_capture_sandboxed_stdin({"cat"}, "", payload, test_limits(), &pr);
        expect_true(started, "cat should start");
        expect_eq_ll(pr.exit_code, 0, "cat exit code");
        expect_true(pr.output == payload, "stdin echoed intact");
    }

    // a child that exits without reading stdin leaves the caller running
    {
        const std::string payload(1 << 20, 'x');
        ProcResult pr;
        bool started = proc_run_capture_sandboxed_stdin({"/bin/true"}, "", payload, test_limits(), &pr);
        expect_true(started, "true should start");
        expect_eq_ll(pr.exit_code, 0, "true exit code");
        pr = ProcResult{};
        started = proc_run_capture_sandboxed_stdin({"/bin/sh", "-c", "echo early; exit 4"}, "", payload, test_limits(), &pr);
        expect_true(started, "sh should start");
        expect_eq_ll(pr.exit_code, 4, "early exit code");
        expect_true(pr.output == "early\n", "output of early exit: " + pr.output);

        sigset_t cur;
        sigemptyset(&cur);
        pthread_sigmask(SIG_BLOCK, nullptr, &cur);
        expect_true(sigismember(&cur, SIGPIPE) == 0, "SIGPIPE mask restored");
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        expect_true(sigismember(&pending, SIGPIPE) == 0, "no SIGPIPE left pending");
    }

    // output cap
    {
        ProcLimits lim = test_limits();
        lim.stdout_max_bytes = 1000;
        ProcResult pr;
        proc_run_capture_sandboxed({"/bin/sh", "-c", "head -c 100000 /dev/zero"}, "", lim, &pr);
        expect_true(pr.output_truncated, "output should be truncated");
        expect_eq_ll((long long)pr.output.size(), 1000, "output capped");
    }

    // timeout
    {
        ProcLimits lim = test_limits();
        lim.timeout_ms = 200;
        ProcResult pr;
        proc_run_capture_sandboxed({"sleep", "5"}, "", lim, &pr);
        expect_true(pr.timed_out, "sleep should time out");
    }

    // cancellation
    {
        std::atomic<bool> cancel{true};
        ProcLimits lim = test_limits();
        lim.cancel = &cancel;
        ProcResult pr;
        proc_run_capture_sandboxed({"sleep", "5"}, "", lim, &pr);
        expect_true(pr.cancelled, "cancel flag should stop the child");
        expect_true(!pr.timed_out, "cancel is not a timeout");
    }

    // missing executable: started, exit 127
    {
        ProcResult pr;
        bool started = proc_run_capture_sandboxed({"/nonexistent/scrapeguard-missing"}, "", test_limits(), &pr);
        expect_true(started, "fork succeeds");
        expect_eq_ll(pr.exit_code, 127, "exec failure exit code");
    }

    // empty argv
    {
        ProcResult pr;
        expect_true(!proc_run_capture_sandboxed({}, "", test_limits(), &pr), "empty argv is refused");
        expect_true(pr.error == "empty argv", "empty argv error");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
