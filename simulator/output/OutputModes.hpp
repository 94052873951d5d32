#pragma once

// Define different output modes for simulation results
enum class OutputMode {
    NONE,           // No snapshots (for benchmarking)
    FILE_CSV,       // One CSV row per particle per snapshot
    FILE_JSONL      // One JSON document per snapshot, one per line
};
