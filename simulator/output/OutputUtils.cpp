#include "OutputUtils.hpp"
#include <iostream>

void printProgressBar(long currentStep, long totalSteps)
{
    double progress = (totalSteps == 0) ? 0.0 : static_cast<double>(currentStep) / totalSteps;
    int barWidth = 50;
    int pos = static_cast<int>(barWidth * progress);
    std::cout << "\r[";
    for (int j = 0; j < barWidth; ++j) {
        if (j < pos) std::cout << "=";
        else if (j == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << int(progress * 100.0) << " %";
    std::cout.flush();
}

void appendMetadata(std::string& metadata, const std::string& key, const std::string& value)
{
    metadata += "# " + key + ": " + value + "\n";
}
