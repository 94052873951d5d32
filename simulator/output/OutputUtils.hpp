#pragma once
#include <string>

// Progress bar display
void printProgressBar(long currentStep, long totalSteps);

// Appends a "# key: value" line to a metadata block
void appendMetadata(std::string& metadata, const std::string& key, const std::string& value);
