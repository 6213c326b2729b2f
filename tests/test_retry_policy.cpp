#include "chunkio/error_handler.hpp"
#include "chunkio/errors.hpp"
#include "chunkio/file_handler.hpp"
#include "chunkio/retry_policy.hpp"
#include "test_helpers.hpp"
#include <cerrno>
#include <stdexcept>

using namespace chunkio;
using namespace std::chrono_literals;
using test::expect;
using ms = std::chrono::milliseconds;

namespace
{
    struct Recorder
    {
        std::vector<int> attempts;
        std::vector<ms> delays;
        std::vector<std::string> errors;
        std::vector<ms> waits;

        RetryCallback on_retry()
        {
            return [this](int attempt, ms delay, const std::exception &e)
            {
                attempts.push_back(attempt);
                delays.push_back(delay);
                errors.push_back(e.what());
            };
        }

        WaitFunction wait()
        {
            return [this](ms delay)
            { waits.push_back(delay); };
        }
    };

    // Throws for the first `failures` calls, then returns `value`
    struct Flaky
    {
        int failures;
        int calls = 0;

        int operator()()
        {
            ++calls;
            if (calls <= failures)
                throw std::runtime_error("failure " + std::to_string(calls));
            return 42;
        }
    };
}

static void test_defaults()
{
    RetryPolicy policy;
    expect(policy.max_attempts() == 3, "default max_attempts is 3");
    expect(policy.initial_delay() == 100ms, "default initial delay is 100ms");
    expect(policy.backoff_multiplier() == 2.0, "default multiplier is 2.0");
    expect(policy.max_delay() == 5000ms, "default max delay is 5000ms");
}

static void test_succeeds_after_failures()
{
    RetryPolicy policy(5, 100ms, 2.0, 5000ms);
    Recorder rec;
    Flaky op{3};

    int result = policy.execute(op, rec.on_retry(), rec.wait());

    expect(result == 42, "success value is returned");
    expect(op.calls == 4, "k-1 failures then success takes k attempts");
    expect(rec.attempts == std::vector<int>{1, 2, 3}, "on_retry gets 1-based attempt indices");
    expect(rec.delays == std::vector<ms>{100ms, 200ms, 400ms}, "delays double from the initial delay");
    expect(rec.waits == rec.delays, "the wait function receives the announced delays");
    expect(rec.errors.size() == 3 && rec.errors[0] == "failure 1", "on_retry sees the thrown error");
}

static void test_blocking_backoff_timing()
{
    RetryPolicy policy(3, 100ms, 2.0, 5000ms);
    Recorder rec;
    Flaky op{2};

    auto start = std::chrono::steady_clock::now();
    int result = policy.execute(op, rec.on_retry());
    auto elapsed = std::chrono::steady_clock::now() - start;

    expect(result == 42, "third attempt succeeds");
    expect(op.calls == 3, "exactly three attempts");
    expect(rec.delays == std::vector<ms>{100ms, 200ms}, "observed delays are 100ms then 200ms");
    expect(elapsed >= 300ms, "the calling thread is blocked for the backoff");
}

static void test_exhausted()
{
    RetryPolicy policy(4, 10ms, 2.0, 5000ms);
    Recorder rec;
    Flaky op{100};

    bool caught = false;
    try
    {
        policy.execute(op, rec.on_retry(), rec.wait());
    }
    catch (const RetryExhausted &e)
    {
        caught = true;
        expect(e.attempts() == 4, "RetryExhausted reports the attempt count");
        expect(test::throws<std::runtime_error>([&]
                                                { std::rethrow_exception(e.last_error()); }),
               "last_error holds the underlying exception");
        try
        {
            std::rethrow_exception(e.last_error());
        }
        catch (const std::runtime_error &inner)
        {
            expect(std::string(inner.what()) == "failure 4", "last_error is the final attempt's error");
        }
    }
    expect(caught, "always-failing operation ends in RetryExhausted");
    expect(op.calls == 4, "exactly max_attempts attempts");
    expect(rec.attempts.size() == 3, "max_attempts - 1 retry notifications");
}

static void test_delay_cap()
{
    RetryPolicy policy(5, 1000ms, 3.0, 5000ms);
    Recorder rec;
    Flaky op{4};

    policy.execute(op, rec.on_retry(), rec.wait());
    expect(rec.delays == std::vector<ms>{1000ms, 3000ms, 5000ms, 5000ms}, "delays are capped at max_delay");
}

static void test_first_attempt_success()
{
    RetryPolicy policy;
    Recorder rec;
    int calls = 0;
    int result = policy.execute([&]
                                { ++calls; return 7; },
                                rec.on_retry(), rec.wait());
    expect(result == 7 && calls == 1, "success on the first attempt returns immediately");
    expect(rec.attempts.empty() && rec.waits.empty(), "no retry or wait after success");
}

static void test_single_attempt()
{
    RetryPolicy policy(1, 100ms, 2.0, 5000ms);
    Recorder rec;
    Flaky op{1};
    expect(test::throws<RetryExhausted>([&]
                                        { policy.execute(op, rec.on_retry(), rec.wait()); }),
           "one allowed attempt fails straight away");
    expect(op.calls == 1 && rec.attempts.empty(), "no retries with max_attempts = 1");
}

static void test_void_operation()
{
    RetryPolicy policy(3, 0ms, 1.0, 0ms);
    int calls = 0;
    policy.execute([&]
                   {
                       if (++calls < 2)
                           throw std::runtime_error("once"); });
    expect(calls == 2, "void operations are retried too");
}

static void test_config_validation()
{
    expect(test::throws<ConfigError>([]
                                     { RetryPolicy p(0, 100ms, 2.0, 5000ms); }),
           "max_attempts < 1 is rejected");
    expect(test::throws<ConfigError>([]
                                     { RetryPolicy p(3, -1ms, 2.0, 5000ms); }),
           "negative initial delay is rejected");
    expect(test::throws<ConfigError>([]
                                     { RetryPolicy p(3, 100ms, 0.5, 5000ms); }),
           "multiplier below 1 is rejected");
    expect(test::throws<ConfigError>([]
                                     { RetryPolicy p(3, 100ms, 2.0, 50ms); }),
           "max_delay below initial_delay is rejected");
}

static void test_schedule_matches_execute()
{
    RetryPolicy policy(4, 100ms, 2.0, 300ms);
    RetrySchedule schedule = policy.schedule();
    auto err = std::make_exception_ptr(std::runtime_error("boom"));

    std::vector<ms> delays;
    expect(schedule.attempt() == 1, "schedule starts at attempt 1");
    delays.push_back(schedule.on_failure(err));
    delays.push_back(schedule.on_failure(err));
    delays.push_back(schedule.on_failure(err));
    expect(delays == std::vector<ms>{100ms, 200ms, 300ms}, "schedule yields the capped backoff sequence");
    expect(schedule.attempt() == 4, "schedule tracks the attempt in progress");
    expect(test::throws<RetryExhausted>([&]
                                        { schedule.on_failure(err); }),
           "schedule throws RetryExhausted after the last attempt");
}

static void test_error_handler_and_engine()
{
    test::TempDir dir("chunkio_retry");
    ErrorHandler handler(RetryPolicy(3, 1ms, 1.0, 1ms));

    int calls = 0;
    int result = handler.execute_with_retry([&]
                                            {
                                                if (++calls < 3)
                                                    throw std::runtime_error("transient");
                                                return calls; },
                                            "flaky operation");
    expect(result == 3, "ErrorHandler retries through its policy");

    bool wrapped_io = false;
    try
    {
        handler.execute_with_retry([&]
                                   { FileHandler missing(dir / "missing.bin"); return 0; },
                                   "opening missing file");
    }
    catch (const RetryExhausted &e)
    {
        wrapped_io = test::throws<IOError>([&]
                                           { std::rethrow_exception(e.last_error()); });
        ErrorHandler::log_error(e, "expected failure");
    }
    expect(wrapped_io, "engine IOError is carried inside RetryExhausted");
}

static void test_exhausted_message_names_last_error()
{
    RetryPolicy policy(2, 0ms, 1.0, 0ms);
    bool caught = false;
    try
    {
        policy.execute([]() -> int
                       { throw std::runtime_error("disk on fire"); });
    }
    catch (const RetryExhausted &e)
    {
        caught = true;
        const std::string what = e.what();
        expect(what.find("disk on fire") != std::string::npos, "RetryExhausted message carries the last error: " + what);
        expect(what.find("2 attempts") != std::string::npos, "RetryExhausted message carries the attempt count");
        expect(e.last_error() != nullptr, "last_error is still attached");
    }
    expect(caught, "two failed attempts end in RetryExhausted");

    RetrySchedule schedule = RetryPolicy(1, 0ms, 1.0, 0ms).schedule();
    try
    {
        schedule.on_failure(std::make_exception_ptr(std::runtime_error("out of inodes")));
    }
    catch (const RetryExhausted &e)
    {
        expect(std::string(e.what()).find("out of inodes") != std::string::npos, "schedule message carries the error");
    }
}

static void test_retry_filter()
{
    RetryPolicy policy(5, 10ms, 2.0, 5000ms);
    Recorder rec;
    int calls = 0;
    RetryFilter only_runtime = [](const std::exception &e)
    { return dynamic_cast<const std::logic_error *>(&e) == nullptr; };

    expect(test::throws<std::logic_error>([&]
                                          { policy.execute([&]() -> int
                                                           { ++calls; throw std::logic_error("permanent"); },
                                                           rec.on_retry(), rec.wait(), only_runtime); }),
           "a rejected error propagates unchanged");
    expect(calls == 1 && rec.waits.empty(), "a rejected error is not retried");

    Flaky op{2};
    expect(policy.execute(op, rec.on_retry(), rec.wait(), only_runtime) == 42, "accepted errors are still retried");
    expect(op.calls == 3, "accepted errors use the normal attempt budget");
}

static void test_error_handler_permanent_errors()
{
    test::TempDir dir("chunkio_permanent");
    test::write_file(dir / "in.bin", test::bytes("payload"));
    ErrorHandler handler(RetryPolicy(3, 1ms, 1.0, 1ms));

    int calls = 0;
    expect(test::throws<ConfigError>([&]
                                     { handler.execute_with_retry([&]
                                                                  { ++calls; FileHandler h(dir / "in.bin", OpenMode::read, 0); return 0; },
                                                                  "opening with chunk size 0"); }),
           "ConfigError escapes ErrorHandler unwrapped");
    expect(calls == 1, "ConfigError is not retried");

    calls = 0;
    expect(test::throws<DecodeError>([&]
                                     { handler.execute_with_retry([&]() -> int
                                                                  { ++calls; throw DecodeError("corrupt archive"); },
                                                                  "decoding"); }),
           "DecodeError escapes ErrorHandler unwrapped");
    expect(calls == 1, "DecodeError is not retried");

    expect(!ErrorHandler::is_transient(ConfigError("x")), "ConfigError is permanent");
    expect(!ErrorHandler::is_transient(DecodeError("x")), "DecodeError is permanent");
    expect(ErrorHandler::is_transient(IOError(EIO, "x")), "IOError is transient");
}

int main()
{
    test_defaults();
    test_succeeds_after_failures();
    test_blocking_backoff_timing();
    test_exhausted();
    test_delay_cap();
    test_first_attempt_success();
    test_single_attempt();
    test_void_operation();
    test_config_validation();
    test_schedule_matches_execute();
    test_error_handler_and_engine();
    test_exhausted_message_names_last_error();
    test_retry_filter();
    test_error_handler_permanent_errors();

    return test::finish("test_retry_policy");
}
