#ifndef INTERFACE_HPP
#define INTERFACE_HPP

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// Console output of the codec driver
class CodecInterface {
private:
    bool quiet;

public:
    CodecInterface(bool quiet = false) : quiet(quiet) {}

    void showBanner() {
        if (quiet) return;

        std::cout << "\n";
        std::cout << "    =======================================================\n";
        std::cout << "    ||            REGION TREE IMAGE CODEC                ||\n";
        std::cout << "    =======================================================\n\n";
    }

    void showSectionHeader(const std::string& title) {
        if (quiet) return;

        std::cout << "\n";
        std::cout << "    +-" << std::string(title.length() + 2, '-') << "-+\n";
        std::cout << "    | " << title << " |\n";
        std::cout << "    +-" << std::string(title.length() + 2, '-') << "-+\n\n";
    }

    // Errors are printed even in quiet mode
    void showError(const std::string& message) {
        std::cerr << "    [ERROR] " << message << std::endl;
    }

    void showWarning(const std::string& message) {
        std::cout << "    [WARNING] " << message << std::endl;
    }

    void showSuccess(const std::string& message) {
        if (quiet) return;
        std::cout << "    [SUCCESS] " << message << std::endl;
    }

    void showInfo(const std::string& message) {
        if (quiet) return;
        std::cout << "    [INFO] " << message << std::endl;
    }

    void showProgressBar(int progress, int total, int width = 40) {
        if (quiet || total <= 0) return;

        float percent = (float)progress / total;
        int completed = (int)(width * percent);

        std::cout << "    [";
        for (int i = 0; i < width; i++) {
            if (i < completed) std::cout << "#";
            else std::cout << " ";
        }

        std::cout << "] " << std::fixed << std::setprecision(1) << (percent * 100.0) << "%" << std::endl;
    }

    void showResultTable(const std::string& title, const std::vector<std::pair<std::string, std::string>>& data) {
        size_t maxLabelWidth = title.length();
        size_t maxValueWidth = 0;
        const size_t VALUE_DISPLAY_LIMIT = 40;

        for (const auto& row : data) {
            maxLabelWidth = std::max(maxLabelWidth, row.first.length());
            maxValueWidth = std::max(maxValueWidth, std::min(row.second.length(), VALUE_DISPLAY_LIMIT));
        }

        maxLabelWidth += 2;
        maxValueWidth += 2;

        size_t tableWidth = maxLabelWidth + maxValueWidth + 3;

        std::cout << "\n    +" << std::string(tableWidth, '-') << "+\n";
        std::cout << "    |" << std::setw(tableWidth) << std::left << " " + title << "|\n";
        std::cout << "    +" << std::string(maxLabelWidth, '-') << "+" << std::string(maxValueWidth + 2, '-') << "+\n";

        for (const auto& row : data) {
            std::cout << "    | " << std::setw(maxLabelWidth - 1) << std::left << row.first << "| ";

            std::string displayValue = row.second;
            if (displayValue.length() > VALUE_DISPLAY_LIMIT) {
                displayValue = displayValue.substr(0, VALUE_DISPLAY_LIMIT - 3) + "...";
            }

            std::cout << std::setw(maxValueWidth + 1) << std::left << displayValue << "|\n";
        }

        std::cout << "    +" << std::string(maxLabelWidth, '-') << "+" << std::string(maxValueWidth + 2, '-') << "+\n";
    }
};

#endif // INTERFACE_HPP
