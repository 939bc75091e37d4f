#include "tests/test_common.h"
#include "tests/test_fakes.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "audio/audio_convert.h"
#include "audio/audio_io.h"
#include "audio/merge_engine.h"
#include "audio/time_stretcher.h"
#include "dubbing/dubbing_config.h"
#include "dubbing/dubbing_job.h"
#include "dubbing/task_store.h"
#include "llm/llm_simplifier.h"
#include "subtitle/cue.h"
#include "subtitle/srt_parser.h"
#include "synthesis/http_tts_engine.h"
#include "synthesis/synthesis_pipeline.h"
#include "text/unicode_utils.h"
#include "timing/cue_optimizer.h"
#include "timing/escalation_gateway.h"
#include "timing/slack_allocator.h"
#include "utils/retry_policy.h"
#include "utils/worker_pool.h"

namespace fs = std::filesystem;

static Cue makeCue(int index, int64_t start, int64_t end, const std::string& text) {
    Cue c;
    c.index = index;
    c.startMs = start;
    c.endMs = end;
    c.text = text;
    return c;
}

static std::string scratchDir() {
    fs::path p = fs::temp_directory_path() / "dubline_unit";
    fs::create_directories(p);
    return p.string();
}

// ── Test: UnicodeUtils ──

static void testUnicode() {
    fprintf(stderr, "\n--- UnicodeUtils ---\n");

    check(UnicodeUtils::countCjkChars("\xE4\xBD\xA0\xE5\xA5\xBD world") == 2, "two CJK ideographs");
    check(UnicodeUtils::countLatinWords("\xE4\xBD\xA0\xE5\xA5\xBD world") == 1, "one Latin word after CJK");
    check(UnicodeUtils::countLatinWords("don't stop") == 3, "apostrophe splits words");
    check(UnicodeUtils::countLatinWords("42, 7") == 0, "digits are not words");
    check(UnicodeUtils::countCjkChars("\xE3\x80\x82") == 0, "ideographic full stop is not an ideograph");

    check(UnicodeUtils::trim("  \t hi there \n") == "hi there", "trim ASCII whitespace");
    check(UnicodeUtils::trim("\xE3\x80\x80x\xE3\x80\x80") == "x", "trim ideographic space");
    check(UnicodeUtils::trim("   ").empty(), "trim all-blank");

    auto cps = UnicodeUtils::toCodepoints("a\xC3\xA9\xE4\xB8\xAD");
    check(cps.size() == 3 && cps[1] == 0xE9 && cps[2] == 0x4E2D, "decode 1/2/3-byte sequences");
    auto bad = UnicodeUtils::toCodepoints("\xE4\xB8");
    check(bad.size() == 2 && bad[0] == 0xFFFD, "truncated sequence -> replacement chars");
    check(UnicodeUtils::encodeUtf8(0x4E2D) == "\xE4\xB8\xAD", "encode 3-byte");

    check(UnicodeUtils::isValidUtf8("a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80"), "valid UTF-8 accepted");
    check(UnicodeUtils::isValidUtf8("\xEF\xBF\xBD"), "literal replacement char is valid");
    check(!UnicodeUtils::isValidUtf8("\xC4\xE3\xBA\xC3"), "GBK bytes rejected");
    check(!UnicodeUtils::isValidUtf8("caf\xE9"), "Latin-1 byte rejected");
    check(!UnicodeUtils::isValidUtf8("\xC0\xAF"), "overlong rejected");
    check(!UnicodeUtils::isValidUtf8("\xED\xA0\x80"), "surrogate rejected");
    check(!UnicodeUtils::isValidUtf8("\xE4\xB8"), "truncated sequence rejected");
}

// ── Test: Cue validation ──

static void testCueValidation() {
    fprintf(stderr, "\n--- Cue validation ---\n");

    std::string reason;
    check(validateCue(makeCue(1, 0, 1000, "hi"), true, reason), "valid cue");
    check(!validateCue(makeCue(1, 0, 1000, "  "), true, reason), "blank text rejected");
    check(!validateCue(makeCue(1, -5, 1000, "hi"), true, reason), "negative start rejected");
    check(!validateCue(makeCue(1, 1000, 1000, "hi"), true, reason), "zero duration rejected");
    check(!validateCue(makeCue(1, 1000, 500, "hi"), true, reason), "end before start rejected");
    check(validateCue(makeCue(1, 0, 0, "hi"), false, reason), "untimed cue accepted without timing");
    check(!validateCue(makeCue(1, 0, 1000, "\xC4\xE3\xBA\xC3"), true, reason) &&
          reason.find("UTF-8") != std::string::npos, "non-UTF-8 text rejected");
    check(!validateCue(makeCue(1, 0, 0, "caf\xE9"), false, reason), "non-UTF-8 untimed text rejected");

    std::vector<Cue> cues = {makeCue(1, 0, 1000, "a"), makeCue(2, 900, 2000, "b"), makeCue(3, 2000, 1500, "c")};
    auto issues = validateCues(cues);
    size_t fatal = 0, warnings = 0;
    for (const auto& i : issues) (i.fatal ? fatal : warnings)++;
    check(fatal == 1, "one fatal issue");
    check(warnings >= 1, "overlap reported as warning");
}

// ── Test: SRT / TXT parsing ──

static void testSrtParser() {
    fprintf(stderr, "\n--- SrtParser ---\n");

    int64_t ms = 0;
    check(SrtParser::parseTimestamp("01:02:03,456", ms) && ms == 3723456, "parse comma timestamp");
    check(SrtParser::parseTimestamp("00:00:01.250", ms) && ms == 1250, "parse dot timestamp");
    check(!SrtParser::parseTimestamp("00:61:00,000", ms), "minutes out of range");
    check(!SrtParser::parseTimestamp("garbage", ms), "garbage timestamp");
    check(SrtParser::formatTimestamp(3723456) == "01:02:03,456", "format timestamp");

    std::string srt =
        "1\r\n00:00:00,000 --> 00:00:01,500\r\nHello\r\nworld\r\n\r\n"
        "2\r\nnot a timing line\r\nbroken\r\n\r\n"
        "7\r\n00:00:02,000 --> 00:00:03,000\r\nSecond\r\n";
    std::vector<Cue> cues;
    std::string err;
    check(SrtParser::parseContent(srt, cues, err), "parse CRLF content");
    check(cues.size() == 2, "malformed block skipped");
    if (cues.size() == 2) {
        check(cues[0].text == "Hello\nworld", "multi-line text joined");
        check(cues[0].startMs == 0 && cues[0].endMs == 1500, "first cue timing");
        check(cues[1].index == 7, "index line kept");
    }

    std::string out = SrtParser::format(cues);
    check(out.find("2\n00:00:02,000 --> 00:00:03,000\nSecond\n") != std::string::npos, "format renumbers");

    std::vector<Cue> none;
    check(!SrtParser::parseContent("just text\n", none, err), "no entries -> false");

    std::string path = scratchDir() + "/bom.srt";
    {
        std::ofstream f(path, std::ios::binary);
        f << "\xEF\xBB\xBF" << "1\n00:00:00,000 --> 00:00:01,000\nBOM\n";
    }
    std::vector<Cue> fromFile;
    check(SrtParser::parseFile(path, fromFile, err) && fromFile.size() == 1 && fromFile[0].index == 1,
          "BOM stripped from file");
}

static void testTxtParser() {
    fprintf(stderr, "\n--- TxtParser ---\n");

    auto cues = TxtParser::parseContent("Hello world. How are you? 3.14 is pi.\n\nNew paragraph\nwithout end");
    check(cues.size() == 4, "four sentences");
    if (cues.size() == 4) {
        check(cues[0].text == "Hello world.", "first sentence");
        check(cues[1].text == "How are you?", "question mark boundary");
        check(cues[2].text == "3.14 is pi.", "decimal point is not a boundary");
        check(cues[3].text == "New paragraph without end", "single line break becomes a space");
        check(cues[3].index == 4 && cues[3].startMs == 0 && cues[3].endMs == 0, "untimed, numbered");
    }

    auto cjk = TxtParser::parseContent("\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x82\xE6\x88\x91\xE5\xBE\x88\xE5\xA5\xBD\xEF\xBC\x81");
    check(cjk.size() == 2, "CJK terminals split");

    auto quoted = TxtParser::parseContent("He said \"hi.\" Then left.");
    check(quoted.size() == 2 && quoted[0].text == "He said \"hi.\"", "closing quote stays attached");

    check(TxtParser::parseContent(" \n\n ").empty(), "blank input -> no cues");
}

// ── Test: TimingSlackAllocator ──

static const TimeBorrow* borrowOf(const TimingDecision& d) { return std::get_if<TimeBorrow>(&d.action); }

static void testSlackAllocator() {
    fprintf(stderr, "\n--- TimingSlackAllocator ---\n");

    TimingSlackAllocator::Config cfg;
    cfg.englishWordMs = 150;
    cfg.minGapThresholdMs = 300;
    cfg.extraBufferMs = 200;

    // 300 ms cue needing 450 ms, 1000 ms gap after it
    std::vector<Cue> cues = {makeCue(1, 0, 300, "one two three"), makeCue(2, 1300, 3000, "ok")};
    TimingSlackAllocator alloc(cfg);
    checkEq(alloc.minRequiredMs("one two three"), 450, "min required from word count");

    auto r = alloc.optimize(cues);
    check(r.cues.size() == 2 && r.decisions.size() == 2, "one decision per cue");
    const TimeBorrow* b = borrowOf(r.decisions[0]);
    check(b && b->frontMs == 0 && b->backMs == 350 && !b->partial, "first cue borrows 350 ms from the back");
    checkEq(r.cues[0].endMs, 650, "first cue extended to 650");
    check(std::holds_alternative<NoChange>(r.decisions[1].action), "second cue unchanged");
    check(r.cues[1].startMs == 1300, "neighbour start untouched");
    check(r.escalations.empty(), "no escalation");
    check(std::string(decisionName(r.decisions[0].action)) == "time_borrow", "decision name");

    // running again changes nothing
    auto again = alloc.optimize(r.cues);
    bool allNoChange = true;
    for (const auto& d : again.decisions) allNoChange = allNoChange && std::holds_alternative<NoChange>(d.action);
    check(allNoChange, "idempotent on its own output");

    // half the slack only
    TimingSlackAllocator::Config half = cfg;
    half.borrowRatio = 0.5;
    half.extraBufferMs = 400;
    auto rh = TimingSlackAllocator(half).optimize(cues);
    const TimeBorrow* bh = borrowOf(rh.decisions[0]);
    check(bh && bh->backMs == 350 && bh->partial, "ratio caps the borrow");
    check(rh.escalations.empty(), "partial borrow that covers the need does not escalate");
}

static void testSlackPartialAndEscalation() {
    fprintf(stderr, "\n--- TimingSlackAllocator: partial / escalation ---\n");

    TimingSlackAllocator::Config cfg;     // 250 ms/word, 200 ms threshold
    std::vector<Cue> cues = {
        makeCue(1, 0, 1000, "x"),
        makeCue(2, 1500, 1600, "a b c d e f"),
        makeCue(3, 2100, 3000, "y"),
    };
    auto r = TimingSlackAllocator(cfg).optimize(cues);

    check(r.cues[1].startMs == 1200 && r.cues[1].endMs == 1900, "all slack on both sides granted");
    check(r.cues[1].startMs - r.cues[0].endMs == 200, "gap before keeps the threshold");
    check(r.cues[2].startMs - r.cues[1].endMs == 200, "gap after keeps the threshold");

    check(r.decisions.size() == 4, "partial cue gets two records");
    const TimeBorrow* b = borrowOf(r.decisions[1]);
    check(b && b->partial && b->frontMs == 300 && b->backMs == 300, "partial borrow record");
    const NeedEscalation* e = std::get_if<NeedEscalation>(&r.decisions[2].action);
    check(e && e->shortfallMs == 800 && e->minRequiredMs == 1500, "escalation record with shortfall");
    check(r.escalations.size() == 1 && r.escalations[0].position == 1, "escalation queued for cue 2");

    // neighbours closer than the threshold: nothing to borrow
    std::vector<Cue> tight = {makeCue(1, 0, 1000, "x"), makeCue(2, 1100, 1200, "a b c")};
    auto rt = TimingSlackAllocator(cfg).optimize(tight);
    check(std::holds_alternative<NeedEscalation>(rt.decisions[1].action), "no slack -> escalation");
    check(rt.cues[1].startMs == 1100 && rt.cues[1].endMs == 1200, "cue left as is");
    check(rt.borrowed == 0, "nothing borrowed");
}

static void testSlackConservation() {
    fprintf(stderr, "\n--- TimingSlackAllocator: slack accounting ---\n");

    TimingSlackAllocator::Config cfg;
    cfg.englishWordMs = 100;
    cfg.minGapThresholdMs = 0;
    cfg.extraBufferMs = 1;

    // need 201 from caps 100 (front) + 300 (back): floors give 50 + 150
    std::vector<Cue> cues = {
        makeCue(1, 0, 200, "a"),
        makeCue(2, 300, 400, "a b c"),
        makeCue(3, 700, 1000, "a"),
    };
    auto r = TimingSlackAllocator(cfg).optimize(cues);
    const TimeBorrow* b = borrowOf(r.decisions[1]);
    check(b && b->frontMs + b->backMs == 201, "rounding loss topped up exactly");
    check(b && b->frontMs == 50 && b->backMs == 151, "top-up from the side with more room");

    // two hungry neighbours share one gap: the second only gets what is left
    cfg.extraBufferMs = 0;
    std::vector<Cue> pair = {makeCue(1, 0, 100, "a b c d"), makeCue(2, 600, 700, "a b c d")};
    auto rp = TimingSlackAllocator(cfg).optimize(pair);
    int64_t used = (rp.cues[0].endMs - 100) + (600 - rp.cues[1].startMs);
    check(used <= 500, "shared gap never over-spent");
    check(rp.cues[0].endMs <= rp.cues[1].startMs, "no overlap introduced");

    // first cue cannot borrow before time zero
    std::vector<Cue> first = {makeCue(1, 50, 100, "a b"), makeCue(2, 1000, 2000, "a")};
    auto rf = TimingSlackAllocator(cfg).optimize(first);
    check(rf.cues[0].startMs == 50, "first cue has no front slack");
}

static void testSlackRejects() {
    fprintf(stderr, "\n--- TimingSlackAllocator: rejected cues ---\n");

    std::vector<Cue> cues = {makeCue(1, 0, 1000, "ok"), makeCue(2, 2000, 1500, "bad"), makeCue(3, 3000, 4000, "fine")};
    auto r = TimingSlackAllocator().optimize(cues);
    check(r.rejected == 1 && r.cues.size() == 2, "malformed cue dropped");
    check(r.decisions.size() == 3 && std::holds_alternative<Rejected>(r.decisions[1].action),
          "rejection recorded in input order");
    check(r.decisions[2].position == 2, "positions refer to the input list");

    std::vector<Cue> gbk = {makeCue(1, 0, 1000, "ok"), makeCue(2, 1500, 1600, "\xC4\xE3\xBA\xC3"),
                            makeCue(3, 3000, 4000, "fine")};
    auto g = TimingSlackAllocator().optimize(gbk);
    check(g.rejected == 1 && g.cues.size() == 2 && g.escalations.empty(), "GBK cue rejected, never escalated");
    check(std::holds_alternative<Rejected>(g.decisions[1].action), "GBK rejection recorded in the trace");

    std::string err;
    TimingSlackAllocator::Config bad;
    bad.borrowRatio = 1.5;
    check(!TimingSlackAllocator::validateConfig(bad, err), "borrow ratio above 1 rejected");
}

// ── Test: RetryPolicy / parallelFor ──

static void testRetryPolicy() {
    fprintf(stderr, "\n--- RetryPolicy ---\n");

    RetryPolicy::Config cfg{3, 500, 3000, 0.0};
    std::vector<int> slept;
    RetryPolicy p(cfg, [&](int ms) { slept.push_back(ms); });
    check(p.delayMs(1) == 500 && p.delayMs(2) == 1000 && p.delayMs(3) == 2000, "exponential backoff");
    check(p.delayMs(4) == 3000 && p.delayMs(10) == 3000, "capped at max delay");

    std::string err;
    int used = 0;
    bool ok = p.run([](int, std::string& e) { e = "nope"; return false; }, err, nullptr, &used);
    check(!ok && used == 4 && err == "nope", "all attempts used, last error kept");
    check(slept.size() == 3, "sleeps only between attempts");

    slept.clear();
    ok = p.run([](int attempt, std::string& e) { e = "flaky"; return attempt == 2; }, err, nullptr, &used);
    check(ok && used == 2 && slept.size() == 1, "stops at first success");

    RetryPolicy::Config jittered{1, 1000, 1000, 0.2};
    RetryPolicy pj(jittered, noSleep, 42);
    int d = pj.delayMs(1);
    check(d >= 800 && d <= 1000, "jitter stays within bounds and cap");

    std::atomic<bool> cancel{true};
    slept.clear();
    ok = p.run([](int, std::string& e) { e = "x"; return false; }, err, &cancel, &used);
    check(!ok && used == 1 && slept.empty(), "cancel stops retrying");
}

static void testParallelFor() {
    fprintf(stderr, "\n--- parallelFor / TaskExecutor ---\n");

    std::vector<size_t> out(64, 0);
    std::atomic<int> active{0}, maxActive{0};
    size_t n = parallelFor(out.size(), 4, [&](size_t i) {
        int now = active.fetch_add(1) + 1;
        int seen = maxActive.load();
        while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        out[i] = i * 2;
        active.fetch_sub(1);
    });
    bool allSet = true;
    for (size_t i = 0; i < out.size(); ++i) allSet = allSet && out[i] == i * 2;
    check(n == 64 && allSet, "every index runs once, results by index");
    check(maxActive.load() <= 4, "concurrency bound respected");

    std::atomic<bool> stop{false};
    size_t dispatched = parallelFor(100, 1, [&](size_t i) { if (i == 9) stop = true; }, &stop);
    check(dispatched == 10, "stop flag halts dispatch");

    std::atomic<int> ran{0};
    {
        TaskExecutor ex(2);
        for (int i = 0; i < 10; ++i) ex.submit([&]() { ran.fetch_add(1); });
        ex.shutdown();
        check(!ex.submit([]() {}), "submit refused after shutdown");
    }
    check(ran.load() == 10, "queued jobs drained on shutdown");
}

// ── Test: EscalationGateway ──

static EscalationGateway::Config fastGateway(int retries) {
    EscalationGateway::Config cfg;
    cfg.maxConcurrency = 4;
    cfg.contextRadius = 3;
    cfg.retry = RetryPolicy::Config{retries, 1, 1, 0.0};
    return cfg;
}

static void testEscalationGateway() {
    fprintf(stderr, "\n--- EscalationGateway ---\n");

    {
        FakeSimplifier fake;
        EscalationGateway gw(fake, fastGateway(3), noSleep);
        Cue c = makeCue(1, 0, 500, "please come over here right now");
        auto first = gw.simplify(c, {c.text}, 0, 1500);
        check(first.simplified && first.text == "please", "simplified text returned");
        auto second = gw.simplify(c, {c.text}, 0, 1500);
        check(second.fromCache && second.text == "please", "second request served from cache");
        check(gw.externalCalls() == 1 && fake.calls == 1, "one external call for duplicates");
        auto other = gw.simplify(c, {c.text}, 0, 1600);
        check(!other.fromCache && gw.externalCalls() == 2, "cache key includes the required duration");
    }
    {
        FakeSimplifier fake;
        fake.failFirst = 2;
        EscalationGateway gw(fake, fastGateway(3), noSleep);
        auto out = gw.simplify(makeCue(1, 0, 500, "a long line here"), {}, 0, 1000);
        check(out.simplified && out.attempts == 3, "succeeds on third attempt");
    }
    {
        FakeSimplifier fake;
        fake.alwaysFail = true;
        EscalationGateway gw(fake, fastGateway(3), noSleep);
        auto out = gw.simplify(makeCue(1, 0, 500, "keep me"), {}, 0, 1000);
        check(!out.simplified && out.text == "keep me", "original text on exhaustion");
        check(!out.error.empty() && out.attempts == 4, "error kept after all attempts");
        check(gw.cacheSize() == 0, "failures are not cached");
    }
    {
        FakeSimplifier fake;
        fake.reply = "this reply is much longer than the input";
        EscalationGateway gw(fake, fastGateway(1), noSleep);
        auto out = gw.simplify(makeCue(1, 0, 500, "short one"), {}, 0, 1000);
        check(!out.simplified && out.text == "short one", "longer reply rejected");
        check(fake.calls == 2, "longer reply retried");
    }
    {
        FakeSimplifier fake;
        EscalationGateway gw(fake, fastGateway(0), noSleep);
        std::vector<Cue> cues;
        for (int i = 0; i < 10; ++i) cues.push_back(makeCue(i + 1, i * 1000, i * 1000 + 500, "line " + std::to_string(i)));
        std::vector<TimingSlackAllocator::Escalation> esc = {{5, 900, 400}};
        auto outs = gw.simplifyAll(cues, esc);
        check(outs.size() == 1 && outs[0].simplified && outs[0].text == "line", "simplifyAll outcome");
        check(fake.last.context.size() == 7 && fake.last.targetInContext == 3, "context window of radius 3");
        check(fake.last.context[3] == "line 5", "target sits inside its context");

        std::vector<TimingSlackAllocator::Escalation> edge = {{0, 900, 400}};
        gw.simplifyAll(cues, edge);
        check(fake.last.context.size() == 4 && fake.last.targetInContext == 0, "window clipped at the start");
    }
}

static void testCueOptimizer() {
    fprintf(stderr, "\n--- CueOptimizer ---\n");

    FakeSimplifier fake;
    EscalationGateway gw(fake, fastGateway(0), noSleep);
    TimingSlackAllocator::Config cfg;
    std::vector<Cue> cues = {makeCue(1, 0, 1000, "x"), makeCue(2, 1100, 1400, "go now please")};

    OptimizationReport report;
    CueOptimizer opt(cfg, &gw);
    auto out = opt.optimize(cues, report);
    check(out.size() == 2 && out[1].text == "go", "escalated cue text replaced");
    check(out[1].startMs == 1100 && out[1].endMs == 1400, "timing kept on simplification");
    check(report.simplified == 1 && report.stillShort == 0, "report counts");

    OptimizationReport noLlm;
    CueOptimizer plain(cfg, nullptr);
    auto same = plain.optimize(cues, noLlm);
    check(same[1].text == "go now please", "no gateway: text untouched");
    check(noLlm.escalationFailed == 1 && noLlm.stillShort == 1, "unresolved cue reported");

    auto j = reportToJson(noLlm);
    check(j["decisions"].size() == 2 && j["decisions"][1]["action"] == "need_escalation",
          "report JSON lists decisions");
}

// ── Test: LlmSimplifier ──

static void testLlmSimplifier() {
    fprintf(stderr, "\n--- LlmSimplifier ---\n");

    std::string text, reason;
    check(LlmSimplifier::parseReply("SIMPLIFIED_TEXT: \"See you\"\nREASON: shorter", text, reason) &&
          text == "See you" && reason == "shorter", "parse reply with quotes");
    check(LlmSimplifier::parseReply("  SIMPLIFIED_TEXT: \xE3\x80\x8C\xE5\xA5\xBD\xE3\x80\x8D", text, reason) &&
          text == "\xE5\xA5\xBD", "corner brackets stripped");
    check(!LlmSimplifier::parseReply("Sure, here you go: see you", text, reason), "missing marker -> false");

    TextSimplifier::Request req;
    req.text = "b";
    req.context = {"a", "b", "c"};
    req.targetInContext = 1;
    req.currentDurationMs = 400;
    req.minRequiredMs = 900;
    std::string prompt = LlmSimplifier::buildPrompt(req);
    check(prompt.find("Line 1 (1 before): a") != std::string::npos, "context before");
    check(prompt.find("Line 2 (current) [SIMPLIFY]: b") != std::string::npos, "target marked");
    check(prompt.find("Line 3 (1 after): c") != std::string::npos, "context after");
    check(prompt.find("SIMPLIFIED_TEXT:") != std::string::npos, "reply format requested");

    LlmSimplifier llm;
    std::string err;
    LlmSimplifier::Config cfg;
    cfg.baseUrl = "not a url";
    check(!llm.init(cfg, err), "bad base URL rejected");

    TextSimplifier::Request gbk = req;
    gbk.context = {"a", "\xC4\xE3\xBA\xC3", "c"};
    std::string body;
    bool threw = false;
    try {
        body = llm.buildRequestBody(gbk);
    } catch (const std::exception&) {
        threw = true;
    }
    check(!threw && body.find("\xEF\xBF\xBD") != std::string::npos, "invalid UTF-8 replaced in chat request");
}

// ── Test: SynthesisPipeline ──

static SynthesisPipeline::Config pipelineCfg(int concurrency) {
    SynthesisPipeline::Config cfg;
    cfg.maxConcurrency = concurrency;
    cfg.retry = RetryPolicy::Config{2, 1, 1, 0.0};
    return cfg;
}

static std::vector<Cue> numberedCues(int n) {
    std::vector<Cue> cues;
    for (int i = 0; i < n; ++i) {
        cues.push_back(makeCue(i + 1, i * 1000, i * 1000 + 800, "cue text " + std::string((size_t)i + 1, 'x')));
    }
    return cues;
}

static void testSynthesisPipeline() {
    fprintf(stderr, "\n--- SynthesisPipeline ---\n");

    {
        FakeEngine engine;
        engine.delayMs = 2;
        SynthesisPipeline p(engine, pipelineCfg(4), noSleep);
        auto cues = numberedCues(20);
        size_t lastDone = 0;
        int progressCalls = 0;
        auto r = p.synthesizeAll(cues, "alice", [&](size_t done, size_t total) {
            ++progressCalls;
            lastDone = (std::max)(lastDone, done);
            (void)total;
        });
        check(r.ok() && r.segments.size() == 20, "all cues synthesized");
        bool ordered = true;
        for (size_t i = 0; i < cues.size(); ++i) {
            ordered = ordered && r.segments[i].index == cues[i].index &&
                      r.segments[i].samples.size() == FakeEngine::samplesFor(cues[i].text);
        }
        check(ordered, "segments in input order");
        check(engine.maxActive.load() <= 4, "engine calls bounded by concurrency");
        check(progressCalls == 20 && lastDone == 20, "progress reported per cue");
        check(engine.lastVoice() == "alice", "voice passed through");
    }
    {
        FakeEngine engine;
        engine.failTimes("cue text xx", 2);
        SynthesisPipeline p(engine, pipelineCfg(2), noSleep);
        auto r = p.synthesizeAll(numberedCues(3), "v");
        check(r.ok(), "transient failure retried");
        check(engine.calls.load() == 5, "two extra calls for the flaky cue");
    }
    {
        FakeEngine engine;
        auto cues = numberedCues(10);
        engine.failAlways(cues[3].text);
        SynthesisPipeline p(engine, pipelineCfg(1), noSleep);
        auto r = p.synthesizeAll(cues, "v");
        check(r.status == BatchStatus::Failed && r.failedCueIndex == 4, "batch fails with the cue index");
        check(r.segments.empty(), "no partial segments on failure");
        checkEq(engine.calls.load(), 6, "no new cues after the failure");
        check(r.error.find("cue 4") != std::string::npos, "error names the cue");
    }
    {
        FakeEngine engine;
        auto cues = numberedCues(4);
        engine.failAlways(cues[1].text);
        SynthesisPipeline::Config cfg = pipelineCfg(2);
        cfg.silenceOnFailure = true;
        SynthesisPipeline p(engine, cfg, noSleep);
        auto r = p.synthesizeAll(cues, "v");
        check(r.ok() && r.substituted == 1, "silence substituted when enabled");
        check(r.segments[1].samples.size() == 800 * 44100 / 1000, "silence covers the cue duration");
        float peak = AudioIO::peakAmplitude(r.segments[1].samples);
        check(peak == 0.0f, "substitute is silent");
    }
    {
        FakeEngine engine;
        std::atomic<bool> cancel{true};
        SynthesisPipeline p(engine, pipelineCfg(4), noSleep);
        auto r = p.synthesizeAll(numberedCues(5), "v", nullptr, &cancel);
        check(r.status == BatchStatus::Cancelled && engine.calls.load() == 0, "cancelled before start");
    }
    {
        FakeEngine engine;
        std::atomic<bool> cancel{false};
        SynthesisPipeline p(engine, pipelineCfg(1), noSleep);
        auto r = p.synthesizeAll(numberedCues(10), "v", [&](size_t done, size_t) {
            if (done == 3) cancel = true;
        }, &cancel);
        check(r.status == BatchStatus::Cancelled, "cancelled mid-batch");
        check(engine.calls.load() == 3, "no calls after cancel");
    }
    for (bool silence : {false, true}) {
        // the user cancels while the call is in flight and the call then fails
        FakeEngine engine;
        auto cues = numberedCues(3);
        engine.failAlways(cues[0].text);
        std::atomic<bool> cancel{false};
        engine.cancelDuringCall = &cancel;
        SynthesisPipeline::Config cfg = pipelineCfg(1);
        cfg.retry.maxRetries = 3;
        cfg.silenceOnFailure = silence;
        SynthesisPipeline p(engine, cfg, noSleep);
        auto r = p.synthesizeAll(cues, "v", nullptr, &cancel);
        std::string tag = silence ? " (silence on failure)" : "";
        check(r.status == BatchStatus::Cancelled, ("failure after an in-flight cancel reports cancelled" + tag).c_str());
        checkEq(r.failedCueIndex, -1, ("no failing cue recorded on cancel" + tag).c_str());
        checkEq(engine.calls.load(), 1, ("no retries after the cancel" + tag).c_str());
        checkEq((long long)r.substituted, 0, ("no silence substituted on cancel" + tag).c_str());
    }
    {
        // reporting never skips or repeats a count under concurrency
        FakeEngine engine;
        engine.delayMs = 1;
        SynthesisPipeline p(engine, pipelineCfg(8), noSleep);
        std::vector<size_t> seen;
        auto r = p.synthesizeAll(numberedCues(40), "v", [&](size_t done, size_t) {
            seen.push_back(done);
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        });
        bool inOrder = seen.size() == 40;
        for (size_t k = 0; inOrder && k < seen.size(); ++k) inOrder = seen[k] == k + 1;
        check(r.ok() && inOrder, "progress reported 1..N in order");
        check(engine.maxActive.load() > 1, "slow progress callback does not serialize the engine calls");
    }
    {
        FakeEngine engine;
        engine.rate = 22050;
        SynthesisPipeline p(engine, pipelineCfg(1), noSleep);
        auto cues = numberedCues(1);
        auto r = p.synthesizeAll(cues, "v");
        check(r.ok() && r.segments[0].sampleRate == 44100 &&
              r.segments[0].samples.size() == 2 * FakeEngine::samplesFor(cues[0].text),
              "engine output resampled to the track rate");
    }
    {
        FakeEngine engine;
        SynthesisPipeline p(engine, pipelineCfg(2), noSleep);
        auto r = p.synthesizeAll(numberedCues(3), "v", [](size_t, size_t) {
            throw std::runtime_error("observer bug");
        });
        check(r.ok(), "throwing progress callback does not fail the batch");
        auto r2 = p.synthesizeAll(numberedCues(3), "v", [](size_t, size_t) { throw 42; });
        check(r2.ok(), "non-standard exception from the progress callback is contained");
    }
}

// ── Test: MergeEngine ──

static AudioSegment makeSegment(int index, int64_t start, int64_t end, size_t n, float v, uint32_t rate) {
    AudioSegment s;
    s.index = index;
    s.startMs = start;
    s.endMs = end;
    s.samples.assign(n, v);
    s.sampleRate = rate;
    return s;
}

static void testMergeConcatenate() {
    fprintf(stderr, "\n--- MergeEngine: concatenate ---\n");

    MergeEngine::Config cfg;
    cfg.sampleRate = 16000;
    MergeEngine m(cfg, nullptr);
    std::vector<AudioSegment> segs = {
        makeSegment(2, 0, 0, 16000, 0.5f, 16000),
        makeSegment(1, 0, 0, 16000, 0.25f, 16000),
        makeSegment(3, 0, 0, 0, 0.0f, 16000),
    };
    MergeEngine::Report rep;
    auto track = m.concatenate(segs, &rep);
    checkEq((long long)track.size(), 32000, "16000 + 16000 + empty = 32000");
    check(track[0] == 0.25f && track[16000] == 0.5f, "concatenated by index");
    check(rep.placed == 2 && rep.skipped == 1, "empty segment skipped");

    std::vector<AudioSegment> other = {makeSegment(1, 0, 0, 8000, 0.1f, 8000)};
    check(m.concatenate(other).size() == 16000, "segment resampled to the track rate");
}

static void testMergeAssemble() {
    fprintf(stderr, "\n--- MergeEngine: assemble ---\n");

    MergeEngine::Config cfg;
    cfg.sampleRate = 1000;      // 1 sample per ms
    FakeStretcher stretcher;
    MergeEngine m(cfg, &stretcher);

    std::vector<AudioSegment> segs = {
        makeSegment(2, 600, 1000, 400, 0.5f, 1000),
        makeSegment(1, 0, 500, 300, 0.25f, 1000),
    };
    MergeEngine::Report rep;
    auto track = m.assemble(segs, &rep);
    checkEq((long long)track.size(), 1000, "track covers the latest end");
    check(track[0] == 0.25f && track[299] == 0.25f && track[300] == 0.0f, "short segment padded");
    check(track[550] == 0.0f, "gap stays silent");
    check(track[600] == 0.5f && track[999] == 0.5f, "exact segment placed at its start");
    check(rep.placed == 2 && rep.padded == 1 && rep.stretched == 0, "assemble report");
    check(stretcher.tempos.empty(), "no stretch needed");

    check(m.msToSample(1234) == 1234, "ms to sample");
    MergeEngine::Config cd;
    cd.sampleRate = 44100;
    check(MergeEngine(cd, nullptr).msToSample(10) == 441, "ms to sample at 44.1 kHz");
}

static void testMergeStretch() {
    fprintf(stderr, "\n--- MergeEngine: stretch ---\n");

    MergeEngine::Config cfg;
    cfg.sampleRate = 1000;
    cfg.speedMode = SpeedMode::HighQuality;
    {
        FakeStretcher stretcher;
        MergeEngine m(cfg, &stretcher);
        MergeEngine::Report rep;
        auto fitted = m.fitToWindow(std::vector<float>(2000, 0.1f), 500, 1, &rep);
        check(stretcher.tempos.size() == 1 && stretcher.tempos[0] == 2.0, "ratio 4 clamped to 2 in high_quality");
        check(fitted.size() == 500, "clamped stretch corrected to the window");
        check(rep.stretched == 1, "stretch counted");
    }
    {
        FakeStretcher stretcher;
        MergeEngine m(cfg, &stretcher);
        auto fitted = m.fitToWindow(std::vector<float>(510, 0.1f), 500, 1, nullptr);
        check(stretcher.tempos.size() == 1 && std::fabs(stretcher.tempos[0] - 1.02) < 1e-9,
              "small overflow is stretched, not cut");
        check(fitted.size() == 500 && fitted[499] == 0.2f, "stretched tail fills the window");
    }
    {
        FakeStretcher stretcher;
        MergeEngine::Config loose = cfg;
        loose.stretchThreshold = 0.05;
        MergeEngine m(loose, &stretcher);
        auto fitted = m.fitToWindow(std::vector<float>(510, 0.1f), 500, 1, nullptr);
        check(stretcher.tempos.empty() && fitted.size() == 500, "overflow inside a raised threshold is truncated");
    }
    {
        FakeStretcher stretcher;
        stretcher.fail = true;
        MergeEngine m(cfg, &stretcher);
        MergeEngine::Report rep;
        auto fitted = m.fitToWindow(std::vector<float>(750, 0.1f), 500, 1, &rep);
        check(fitted.size() == 500 && rep.stretchFailed == 1, "failed stretch falls back to truncation");
        check(fitted[0] == 0.1f, "truncated audio keeps its head");
    }
    {
        MergeEngine m(cfg, nullptr);
        check(m.fitToWindow(std::vector<float>(900, 0.1f), 500, 1, nullptr).size() == 500,
              "no stretcher: exact length anyway");
    }

    MergeEngine std4({1000, SpeedMode::Standard, false, 1.0f, 0.05}, nullptr);
    check(std4.clampSpeed(5.0) == 4.0 && std4.clampSpeed(0.1) == 0.25, "standard range");
    MergeEngine wide({1000, SpeedMode::UltraWide, false, 1.0f, 0.05}, nullptr);
    check(wide.clampSpeed(12.0) == 10.0 && wide.clampSpeed(0.05) == 0.1, "ultra wide range");

    SpeedMode mode;
    check(parseSpeedMode("ultra_wide", mode) && mode == SpeedMode::UltraWide, "parse speed mode");
    check(!parseSpeedMode("warp", mode), "unknown speed mode");

    check(FfmpegTimeStretcher::atempoChain(1.5) == "atempo=1.500000", "single atempo");
    check(FfmpegTimeStretcher::atempoChain(3.0) == "atempo=2.000000,atempo=1.500000", "chained above 2");
    check(FfmpegTimeStretcher::atempoChain(0.25) == "atempo=0.500000,atempo=0.500000", "chained below 0.5");
}

static void testMergeBoundsAndPeak() {
    fprintf(stderr, "\n--- MergeEngine: bounds / peak ---\n");

    MergeEngine::Config cfg;
    cfg.sampleRate = 1000;
    MergeEngine m(cfg, nullptr);

    std::vector<AudioSegment> segs = {
        makeSegment(1, 0, 400, 400, 2.0f, 1000),
        makeSegment(2, 700, 700, 100, 0.5f, 1000),
        makeSegment(3, 500, 800, 0, 0.0f, 1000),
    };
    MergeEngine::Report rep;
    auto track = m.assemble(segs, &rep);
    check(track.size() == 800, "track length from max end");
    check(rep.placed == 1 && rep.skipped == 2, "empty window and empty audio skipped");
    check(rep.normalized && rep.peakBefore == 2.0f, "peak above ceiling normalized");
    check(std::fabs(AudioIO::peakAmplitude(track) - 1.0f) < 1e-6f, "peak now at the ceiling");

    std::vector<float> quiet(10, 0.5f);
    MergeEngine::Report qr;
    m.peakNormalize(quiet, &qr);
    check(!qr.normalized && quiet[0] == 0.5f, "quiet track untouched");

    check(m.assemble({}).empty(), "no segments -> empty track");
}

// ── Test: AudioIO / AudioConvert ──

static void testAudio() {
    fprintf(stderr, "\n--- AudioIO / AudioConvert ---\n");

    std::vector<float> tone(1000);
    for (size_t i = 0; i < tone.size(); ++i) tone[i] = 0.5f * (float)std::sin(2.0 * 3.14159265358979 * 440.0 * i / 16000.0);

    std::vector<uint8_t> wav;
    check(AudioIO::encodeWav(tone, 16000, wav), "encode WAV to memory");
    check(wav.size() > 44 && std::string(wav.begin(), wav.begin() + 4) == "RIFF", "RIFF header");
    check(AudioIO::detectFormat(wav.data(), wav.size()) == AudioFormat::WAV, "detect WAV");

    std::vector<float> back;
    std::string err;
    check(AudioIO::decodeToMono(wav.data(), wav.size(), 16000, back, err) && back.size() == 1000, "decode WAV");
    float maxDiff = 0.0f;
    for (size_t i = 0; i < back.size() && i < tone.size(); ++i) maxDiff = (std::max)(maxDiff, std::fabs(back[i] - tone[i]));
    check(maxDiff < 1e-3f, "int16 quantization only");

    std::vector<float> up;
    AudioIO::resample(tone, 16000, 32000, up);
    check(up.size() == 2000, "resample doubles length");
    std::vector<float> mono;
    AudioIO::toMono({1.0f, 0.0f, 0.5f, 0.5f}, 2, mono);
    check(mono.size() == 2 && mono[0] == 0.5f && mono[1] == 0.5f, "stereo averaged to mono");

    AudioInfo info = AudioIO::describe(std::vector<float>(44100, 0.5f), 44100);
    check(info.durationSec == 1.0 && info.peak == 0.5f && std::fabs(info.rms - 0.5f) < 1e-6f, "describe");

    uint8_t junk[8] = {1, 2, 3, 4, 5, 6, 7, 8};
    check(!AudioIO::decodeToMono(junk, sizeof(junk), 16000, back, err) && !err.empty(), "junk rejected");

    AudioConvert::OutputFormat fmt;
    check(AudioConvert::parseOutputFormat("mp3", fmt) && fmt == AudioConvert::OutputFormat::MP3, "parse mp3");
    check(!AudioConvert::parseOutputFormat("wma", fmt), "unknown output format");
    check(std::string(AudioConvert::formatExtension(AudioConvert::OutputFormat::OPUS)) == ".opus", "opus extension");
    check(std::string(AudioConvert::contentType(AudioConvert::OutputFormat::WAV)) == "audio/wav", "wav content type");

    std::string path = scratchDir() + "/nested/dir/out.wav";
    fs::remove_all(scratchDir() + "/nested");
    check(AudioConvert::exportAudio(tone, 16000, path, AudioConvert::OutputFormat::WAV, {}, err), "export WAV");
    check(fs::exists(path), "parent directories created");

    std::string tmpPath;
    {
        AudioConvert::TempFile tmp(".wav");
        tmpPath = tmp.path();
        std::ofstream(tmpPath) << "x";
        check(fs::exists(tmpPath), "temp file usable");
    }
    check(!fs::exists(tmpPath), "temp file removed on scope exit");
}

// ── Test: TaskStore ──

static void testTaskStore() {
    fprintf(stderr, "\n--- TaskStore ---\n");

    TaskStore store;
    std::string id = store.create("dubbing");
    check(id.size() == 32 && id.find_first_not_of("0123456789abcdef") == std::string::npos, "32 hex id");

    TaskStatus st;
    check(store.get(id, st) && st.state == TaskState::Queued, "created queued");
    check(store.start(id) && !store.start(id), "start only from queued");
    store.updateProgress(id, 50, "half");
    store.updateProgress(id, 30, "back");
    store.get(id, st);
    check(st.progress == 50 && st.message == "back", "progress never goes backwards");

    check(store.complete(id, "/tmp/x.wav"), "complete");
    store.get(id, st);
    check(st.state == TaskState::Completed && st.progress == 100 && st.resultPath == "/tmp/x.wav", "completed state");
    check(store.cancel(id) == CancelOutcome::AlreadyTerminal, "cancel after completion is a conflict");
    check(!store.fail(id, "late"), "terminal state is final");
    check(!store.updateProgress(id, 10, "late"), "progress ignored once terminal");

    std::string q = store.create("dubbing");
    auto flag = store.cancelFlag(q);
    check(store.cancel(q) == CancelOutcome::Cancelled && flag && flag->load(), "cancel sets the flag");
    check(store.cancel(q) == CancelOutcome::AlreadyTerminal, "second cancel is a no-op");
    check(!store.start(q), "cancelled task never starts");
    check(store.cancel("ffff") == CancelOutcome::NotFound && !store.cancelFlag("ffff"), "unknown id");

    std::string f = store.create("dubbing");
    store.start(f);
    store.fail(f, "boom", 3);
    store.get(f, st);
    check(st.state == TaskState::Failed && st.failedCueIndex == 3 && st.error == "boom", "failure recorded");
    check(store.size() == 3, "three tasks");

    std::string running = store.create("dubbing");
    store.start(running);
    auto now = std::chrono::steady_clock::now();
    check(store.evictExpired(std::chrono::seconds(60), now).empty(), "fresh finished tasks kept");
    auto evicted = store.evictExpired(std::chrono::seconds(60), now + std::chrono::seconds(61));
    bool hasResult = false;
    for (const auto& e : evicted) hasResult = hasResult || e.resultPath == "/tmp/x.wav";
    check(evicted.size() == 3 && hasResult, "expired terminal tasks evicted with their result paths");
    check(store.size() == 1 && store.get(running, st) && st.state == TaskState::Processing,
          "running task survives eviction");
    check(!store.get(id, st), "evicted task is gone");
}

// ── Test: DubbingConfig ──

static void testDubbingConfig() {
    fprintf(stderr, "\n--- DubbingConfig ---\n");

    DubbingConfig cfg;
    const char* doc = R"({
        "server": {"port": 9000, "task_workers": 2},
        "logging": {"level": "debug"},
        "tts": {"base_url": "http://tts.local:8000/v1", "voice": "bob", "extra": {"cfg_scale": 1.5}},
        "synthesis": {"max_concurrency": 3, "max_retries": 4, "silence_on_failure": true, "sample_rate": 24000},
        "time_borrowing": {"borrow_ratio": 0.5, "extra_buffer_ms": 100},
        "subtitle_optimization": {"enabled": true, "model": "m", "context_radius": 2},
        "merge": {"strategy": "basic", "speed_mode": "high_quality", "output_format": "mp3"}
    })";
    check(parseDubbingConfig(doc, cfg), "parse full config");
    check(cfg.server.port == 9000 && cfg.server.taskWorkers == 2, "server section");
    check(cfg.logging.level == LogLevel::DEBUG, "log level");
    check(cfg.defaultVoice == "bob" && cfg.tts.extra["cfg_scale"] == 1.5, "tts section");
    check(cfg.synthesis.maxConcurrency == 3 && cfg.synthesis.retry.maxRetries == 4 && cfg.synthesis.silenceOnFailure,
          "synthesis section");
    check(cfg.merge.sampleRate == 24000, "merge rate follows synthesis rate");
    check(cfg.timing.borrowRatio == 0.5 && cfg.timing.extraBufferMs == 100, "time borrowing section");
    check(cfg.optimization.enabled && cfg.optimization.gateway.contextRadius == 2, "optimization section");
    check(cfg.strategy == MergeStrategy::Basic && cfg.merge.speedMode == SpeedMode::HighQuality &&
          cfg.outputFormat == "mp3", "merge section");

    DubbingConfig d1, d2, d3, d4;
    check(!parseDubbingConfig("{ not json", d1), "malformed JSON rejected");
    check(!parseDubbingConfig(R"({"time_borrowing": {"borrow_ratio": 1.5}})", d2), "ratio out of range rejected");
    check(!parseDubbingConfig(R"({"server": {"port": "eighty"}})", d3), "wrong type rejected");
    check(!parseDubbingConfig(R"({"merge": {"strategy": "magic"}})", d4), "unknown strategy rejected");

    DubbingConfig defaults;
    std::string err;
    check(validateDubbingConfig(defaults, err), "defaults are valid");
    check(!defaults.synthesis.silenceOnFailure, "fail-fast by default");
    DubbingConfig ttl;
    check(parseDubbingConfig(R"({"server": {"task_ttl_sec": 0}})", ttl) && ttl.server.taskTtlSec == 0,
          "task ttl read from config");
    ttl.server.taskTtlSec = -1;
    check(!validateDubbingConfig(ttl, err), "negative task ttl rejected");

    HttpTtsEngine tts;
    HttpTtsEngine::Config tc;
    tc.extra = {{"cfg_scale", 1.3}};
    check(tts.init(tc, err), "tts init");
    SynthesisEngine::Request req;
    req.text = "hello";
    req.voiceRef = "alice";
    req.extra = {{"cfg_scale", 2.0}, {"seed", 7}};
    auto body = tts.buildBody(req);
    check(body["input"] == "hello" && body["voice"] == "alice" && body["model"] == "tts-1", "speech body");
    check(body["cfg_scale"] == 2.0 && body["seed"] == 7, "request extra overrides config extra");

    req.text = "\xC4\xE3\xBA\xC3";
    std::string encoded;
    bool threw = false;
    try {
        encoded = tts.encodeBody(req);
    } catch (const std::exception&) {
        threw = true;
    }
    check(!threw && encoded.find("\xEF\xBF\xBD") != std::string::npos, "invalid UTF-8 replaced in speech body");
}

// ── Test: runDubbing ──

static DubbingServices fakeServices(std::shared_ptr<FakeEngine> engine) {
    DubbingServices s;
    s.engine = engine;
    s.stretcher = std::make_shared<FakeStretcher>();
    return s;
}

static const char* kTwoCueSrt =
    "1\n00:00:00,000 --> 00:00:01,000\nHello there\n\n"
    "2\n00:00:01,500 --> 00:00:03,000\nGeneral Kenobi\n";

static void testRunDubbing() {
    fprintf(stderr, "\n--- runDubbing ---\n");

    DubbingConfig cfg;
    cfg.synthesis.retry.maxRetries = 0;
    const std::string dir = scratchDir();

    {
        auto engine = std::make_shared<FakeEngine>();
        DubbingServices services = fakeServices(engine);
        DubbingRequest req;
        req.content = kTwoCueSrt;
        req.voice = "carol";
        req.outputPath = dir + "/two.wav";
        std::vector<int> pcts;
        auto out = runDubbing(req, cfg, services, [&](int p, const std::string&) { pcts.push_back(p); }, nullptr);
        check(out.ok() && out.cueCount == 2, "SRT job completes");
        check(std::fabs(out.info.durationSec - 3.0) < 1e-9, "track spans the last cue end");
        check(!pcts.empty() && std::is_sorted(pcts.begin(), pcts.end()) && pcts.back() == 90, "progress monotonic");
        check(engine->lastVoice() == "carol", "request voice used");

        std::ifstream f(out.outputPath, std::ios::binary);
        std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        std::vector<float> decoded;
        std::string err;
        check(AudioIO::decodeToMono((const uint8_t*)bytes.data(), bytes.size(), 44100, decoded, err) &&
              decoded.size() == 132300, "written WAV has the track length");
    }
    {
        auto engine = std::make_shared<FakeEngine>();
        DubbingServices services = fakeServices(engine);
        DubbingRequest req;
        req.inputFormat = InputFormat::Txt;
        req.content = "One. Two.";
        req.outputPath = dir + "/txt.wav";
        auto out = runDubbing(req, cfg, services, nullptr, nullptr);
        check(out.ok() && out.info.sampleCount == 800, "plain text concatenated");
        check(engine->lastVoice() == cfg.defaultVoice, "default voice when none given");
    }
    {
        auto engine = std::make_shared<FakeEngine>();
        engine->failAlways("General Kenobi");
        DubbingServices services = fakeServices(engine);
        DubbingRequest req;
        req.content = kTwoCueSrt;
        req.outputPath = dir + "/fail.wav";
        fs::remove(req.outputPath);
        auto out = runDubbing(req, cfg, services, nullptr, nullptr);
        check(out.status == BatchStatus::Failed && out.failedCueIndex == 2, "failure carries the cue index");
        check(!fs::exists(req.outputPath), "no output on failure");
    }
    {
        auto engine = std::make_shared<FakeEngine>();
        DubbingServices services = fakeServices(engine);
        DubbingRequest req;
        req.content = kTwoCueSrt;
        req.outputPath = dir + "/cancel.wav";
        std::atomic<bool> cancel{true};
        auto out = runDubbing(req, cfg, services, nullptr, &cancel);
        check(out.status == BatchStatus::Cancelled && engine->calls.load() == 0, "cancel before start");
    }
    {
        auto engine = std::make_shared<FakeEngine>();
        DubbingServices services = fakeServices(engine);
        DubbingRequest req;
        req.content = "nothing to see";
        req.outputPath = dir + "/bad.wav";
        auto out = runDubbing(req, cfg, services, nullptr, nullptr);
        check(out.status == BatchStatus::Failed && !out.error.empty(), "unparseable input fails");
    }
    {
        // a GBK-encoded cue is dropped; the rest of the file is dubbed
        auto engine = std::make_shared<FakeEngine>();
        DubbingServices services = fakeServices(engine);
        DubbingRequest req;
        req.content = std::string(kTwoCueSrt) + "\n3\n00:00:03,500 --> 00:00:04,000\n\xC4\xE3\xBA\xC3\n";
        req.outputPath = dir + "/gbk.wav";
        auto out = runDubbing(req, cfg, services, nullptr, nullptr);
        check(out.ok() && out.cueCount == 2, "non-UTF-8 cue rejected, job completes");
        check(engine->calls.load() == 2, "rejected cue never reaches the engine");

        req.content = "1\n00:00:00,000 --> 00:00:01,000\n\xC4\xE3\xBA\xC3\n";
        out = runDubbing(req, cfg, services, nullptr, nullptr);
        check(out.status == BatchStatus::Failed && out.error == "no valid cues in input",
              "all-GBK file fails cleanly");
    }
    {
        TaskStore store;
        auto engine = std::make_shared<FakeEngine>();
        DubbingServices services = fakeServices(engine);
        DubbingRequest req;
        req.content = kTwoCueSrt;
        req.outputPath = dir + "/task.wav";
        std::string id = store.create("dubbing");
        runDubbingTask(store, id, req, cfg, services);
        TaskStatus st;
        store.get(id, st);
        check(st.state == TaskState::Completed && st.resultPath == req.outputPath, "task completed in store");

        std::string gone = store.create("dubbing");
        store.cancel(gone);
        int before = engine->calls.load();
        runDubbingTask(store, gone, req, cfg, services);
        check(engine->calls.load() == before, "cancelled task is not run");
    }
}

int runUnitTests() {
    std::cout << "\n=== Text & Subtitles ===" << std::endl;
    testUnicode();
    testCueValidation();
    testSrtParser();
    testTxtParser();

    std::cout << "\n=== Timing ===" << std::endl;
    testSlackAllocator();
    testSlackPartialAndEscalation();
    testSlackConservation();
    testSlackRejects();
    testRetryPolicy();
    testParallelFor();
    testEscalationGateway();
    testCueOptimizer();
    testLlmSimplifier();

    std::cout << "\n=== Synthesis & Merge ===" << std::endl;
    testSynthesisPipeline();
    testMergeConcatenate();
    testMergeAssemble();
    testMergeStretch();
    testMergeBoundsAndPeak();
    testAudio();

    std::cout << "\n=== Jobs ===" << std::endl;
    testTaskStore();
    testDubbingConfig();
    testRunDubbing();

    return testsFailed > 0 ? 1 : 0;
}
