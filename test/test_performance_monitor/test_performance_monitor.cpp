/**
 * @file test_performance_monitor.cpp
 * @brief Unit tests for the rolling-window performance monitor
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include "../../src/hardware/PerformanceMonitor.h"

using namespace cosmicled::hardware;

void setUp(void) {}
void tearDown(void) {}

void test_empty_window() {
    PerformanceMonitor perf;
    perf.begin(30);
    PerformanceStats stats = perf.snapshot();
    TEST_ASSERT_EQUAL_UINT8(0, stats.windowSamples);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, stats.fps);
    TEST_ASSERT_EQUAL_UINT32(0, stats.totalFrames);
    TEST_ASSERT_EQUAL_UINT32(33333, perf.getTargetFrameTimeUs());
}

void test_steady_frames() {
    PerformanceMonitor perf;
    perf.begin(50);
    for (int i = 0; i < 10; i++) {
        perf.record(20000);
    }
    PerformanceStats stats = perf.snapshot();
    TEST_ASSERT_EQUAL_UINT8(10, stats.windowSamples);
    TEST_ASSERT_EQUAL_UINT32(20000, stats.avgFrameTimeUs);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 50.0f, stats.fps);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 50.0f, stats.instantFps);
    TEST_ASSERT_EQUAL_UINT32(0, stats.droppedFrames);
}

void test_min_max_and_instant() {
    PerformanceMonitor perf;
    perf.begin(30);
    perf.record(30000);
    perf.record(40000);
    perf.record(20000);
    PerformanceStats stats = perf.snapshot();
    TEST_ASSERT_EQUAL_UINT32(20000, stats.minFrameTimeUs);
    TEST_ASSERT_EQUAL_UINT32(40000, stats.maxFrameTimeUs);
    TEST_ASSERT_EQUAL_UINT32(30000, stats.avgFrameTimeUs);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 50.0f, stats.instantFps);
}

void test_dropped_frame_threshold() {
    PerformanceMonitor perf;
    perf.begin(100);  // 10 ms slot
    perf.record(19000);
    perf.record(20000);
    perf.record(20001);
    perf.record(45000);
    PerformanceStats stats = perf.snapshot();
    TEST_ASSERT_EQUAL_UINT32(2, stats.droppedFrames);
    TEST_ASSERT_EQUAL_UINT32(4, stats.totalFrames);
}

void test_window_wraps() {
    PerformanceMonitor perf;
    perf.begin(30);
    for (int i = 0; i < PerformanceMonitor::HISTORY_SIZE; i++) {
        perf.record(100000);
    }
    for (int i = 0; i < PerformanceMonitor::HISTORY_SIZE; i++) {
        perf.record(10000);
    }
    PerformanceStats stats = perf.snapshot();
    TEST_ASSERT_EQUAL_UINT8(PerformanceMonitor::HISTORY_SIZE, stats.windowSamples);
    TEST_ASSERT_EQUAL_UINT32(10000, stats.avgFrameTimeUs);
    TEST_ASSERT_EQUAL_UINT32(10000, stats.maxFrameTimeUs);
    TEST_ASSERT_EQUAL_UINT32(2 * PerformanceMonitor::HISTORY_SIZE, stats.totalFrames);
}

void test_set_target_keeps_history() {
    PerformanceMonitor perf;
    perf.begin(30);
    perf.record(33000);
    perf.setTargetFps(60);
    TEST_ASSERT_EQUAL_UINT32(16666, perf.getTargetFrameTimeUs());
    perf.record(40000);  // > 2 x 16.6 ms
    PerformanceStats stats = perf.snapshot();
    TEST_ASSERT_EQUAL_UINT32(2, stats.totalFrames);
    TEST_ASSERT_EQUAL_UINT32(1, stats.droppedFrames);
}

void test_begin_resets() {
    PerformanceMonitor perf;
    perf.begin(30);
    perf.record(500000);
    perf.begin(30);
    PerformanceStats stats = perf.snapshot();
    TEST_ASSERT_EQUAL_UINT32(0, stats.totalFrames);
    TEST_ASSERT_EQUAL_UINT32(0, stats.droppedFrames);
}

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_empty_window);
    RUN_TEST(test_steady_frames);
    RUN_TEST(test_min_max_and_instant);
    RUN_TEST(test_dropped_frame_threshold);
    RUN_TEST(test_window_wraps);
    RUN_TEST(test_set_target_keeps_history);
    RUN_TEST(test_begin_resets);

    return UNITY_END();
}

#endif // NATIVE_BUILD
