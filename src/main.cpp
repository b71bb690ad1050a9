#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ChannelPipeline.hpp"
#include "CodecError.hpp"
#include "ImageIO.hpp"
#include "QualityMetrics.hpp"
#include "interface.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;
namespace fs = std::filesystem;

enum class CodecMode {
    ENCODE,
    DECODE
};

struct CodecOptions {
    CodecMode mode = CodecMode::ENCODE;
    string inputPath;
    string outputPath;
    string payloadPath;
    string overlayPath;
    Cutoffs cutoffs = {50, 4, 100};
    double targetCompressionPct = 0.0;     // 0 disables the cutoff search
    int rank = 0;                          // decode only
    bool view = false;
    bool quiet = false;
};

void printUsage() {
    cout << "Usage:\n"
         << "  regiontree_codec                      interactive mode\n"
         << "  regiontree_codec encode <input> [output.png] [--cutoffs L CB CR] [--target PCT]\n"
         << "                          [--payload FILE] [--overlay FILE] [--view] [--quiet]\n"
         << "  regiontree_codec decode <payload> <rank> <output.png> [--quiet]\n";
}

string cleanPath(const string& path) {
    string cleanedPath = path;

    if (cleanedPath.size() >= 2 &&
        ((cleanedPath.front() == '"' && cleanedPath.back() == '"') ||
         (cleanedPath.front() == '\'' && cleanedPath.back() == '\''))) {
        cleanedPath = cleanedPath.substr(1, cleanedPath.size() - 2);
    }

    return cleanedPath;
}

bool validateImageFile(const string& path, string& errorMessage) {
    if (!fs::exists(path)) {
        errorMessage = "File not found: " + path;
        return false;
    }

    string extension = fs::path(path).extension().string();
    transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    if (extension != ".jpg" && extension != ".jpeg" && extension != ".png" &&
        extension != ".webp" && extension != ".bmp" && extension != ".tiff" &&
        extension != ".tif" && extension != ".ppm" && extension != ".pgm") {
        errorMessage = "Unsupported file format. Use JPG, JPEG, PNG, WEBP, BMP, TIFF or PPM/PGM.";
        return false;
    }

    return true;
}

bool validateAndCreateDirectory(const string& path, string& errorMessage) {
    try {
        fs::path dirPath = fs::path(path).parent_path();
        if (!dirPath.empty() && !fs::exists(dirPath)) {
            if (!fs::create_directories(dirPath)) {
                errorMessage = "Failed to create directory: " + dirPath.string();
                return false;
            }
        }
        return true;
    } catch (const fs::filesystem_error& e) {
        errorMessage = e.what();
        return false;
    }
}

bool parseCutoff(const string& text, uint8_t& cutoff, string& errorMessage) {
    char* end = nullptr;
    long value = strtol(text.c_str(), &end, 10);

    if (text.empty() || *end != '\0') {
        errorMessage = "Cutoff must be an integer, got '" + text + "'";
        return false;
    }
    if (value < 0 || value > 255) {
        errorMessage = "Cutoff must be between 0 and 255, got " + text;
        return false;
    }

    cutoff = static_cast<uint8_t>(value);
    return true;
}

bool validateTargetCompression(double targetCompression, string& errorMessage) {
    if (targetCompression <= 0.0 || targetCompression >= 100.0) {
        errorMessage = "Target compression must be between 0 and 100 percent";
        return false;
    }
    return true;
}

string defaultOutputPath(const string& inputPath) {
    fs::path inputFile(inputPath);
    fs::path outputFile = inputFile.parent_path() / (inputFile.stem().string() + "_compressed.png");
    return outputFile.string();
}

bool parseArguments(int argc, char* argv[], CodecOptions& options, string& errorMessage) {
    vector<string> args(argv + 1, argv + argc);
    vector<string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const string& arg = args[i];

        if (arg == "--cutoffs") {
            if (i + 3 >= args.size()) {
                errorMessage = "--cutoffs needs three values";
                return false;
            }
            if (!parseCutoff(args[i + 1], options.cutoffs.luma, errorMessage) ||
                !parseCutoff(args[i + 2], options.cutoffs.cb, errorMessage) ||
                !parseCutoff(args[i + 3], options.cutoffs.cr, errorMessage)) {
                return false;
            }
            i += 3;
        } else if (arg == "--target") {
            if (i + 1 >= args.size()) {
                errorMessage = "--target needs a percentage";
                return false;
            }
            char* end = nullptr;
            options.targetCompressionPct = strtod(args[i + 1].c_str(), &end);
            if (*end != '\0' || !validateTargetCompression(options.targetCompressionPct, errorMessage)) {
                if (errorMessage.empty()) errorMessage = "Invalid target: " + args[i + 1];
                return false;
            }
            i += 1;
        } else if (arg == "--payload" || arg == "--overlay") {
            if (i + 1 >= args.size()) {
                errorMessage = arg + " needs a file path";
                return false;
            }
            (arg == "--payload" ? options.payloadPath : options.overlayPath) = cleanPath(args[i + 1]);
            i += 1;
        } else if (arg == "--view") {
            options.view = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg.rfind("--", 0) == 0) {
            errorMessage = "Unknown option " + arg;
            return false;
        } else {
            positional.push_back(cleanPath(arg));
        }
    }

    if (positional.empty()) {
        errorMessage = "Missing command";
        return false;
    }

    if (positional[0] == "encode") {
        if (positional.size() < 2 || positional.size() > 3) {
            errorMessage = "encode takes an input image and an optional output image";
            return false;
        }
        options.mode = CodecMode::ENCODE;
        options.inputPath = positional[1];
        options.outputPath = positional.size() == 3 ? positional[2] : defaultOutputPath(positional[1]);
        return validateImageFile(options.inputPath, errorMessage);
    }

    if (positional[0] == "decode") {
        if (positional.size() != 4) {
            errorMessage = "decode takes a payload, a rank and an output image";
            return false;
        }
        options.mode = CodecMode::DECODE;
        options.payloadPath = positional[1];
        options.rank = atoi(positional[2].c_str());
        options.outputPath = positional[3];
        if (options.rank < 2 || !isPowerOfTwo(options.rank)) {
            errorMessage = "Rank must be a power of two >= 2, got " + positional[2];
            return false;
        }
        return true;
    }

    errorMessage = "Unknown command " + positional[0];
    return false;
}

void promptOptions(CodecOptions& options, CodecInterface& ui) {
    string line;
    string errorMessage;

    ui.showSectionHeader("INPUT IMAGE");
    while (true) {
        cout << "    Input image path: ";
        if (!getline(cin, line)) throw runtime_error("Input closed");

        line = cleanPath(line);
        if (validateImageFile(line, errorMessage)) {
            options.inputPath = line;
            break;
        }
        ui.showError(errorMessage);
    }

    ui.showSectionHeader("CUTOFFS");
    cout << "    Regions whose value spread is below the cutoff are approximated.\n";
    cout << "    Chroma usually tolerates much larger cutoffs than luma.\n\n";
    while (true) {
        cout << "    Cutoffs as 'L CB CR', a target like '75%', or empty for 50 4 100: ";
        if (!getline(cin, line)) throw runtime_error("Input closed");

        if (line.empty()) break;

        if (line.back() == '%') {
            double target = atof(line.substr(0, line.size() - 1).c_str());
            if (validateTargetCompression(target, errorMessage)) {
                options.targetCompressionPct = target;
                break;
            }
            ui.showError(errorMessage);
            continue;
        }

        istringstream fields(line);
        string l, cb, cr, extra;
        fields >> l >> cb >> cr;
        if (fields >> extra || cr.empty()) {
            ui.showError("Enter exactly three values");
            continue;
        }
        if (parseCutoff(l, options.cutoffs.luma, errorMessage) &&
            parseCutoff(cb, options.cutoffs.cb, errorMessage) &&
            parseCutoff(cr, options.cutoffs.cr, errorMessage)) {
            break;
        }
        ui.showError(errorMessage);
    }

    ui.showSectionHeader("OUTPUT");
    cout << "    Output image path (empty for " << defaultOutputPath(options.inputPath) << "): ";
    if (!getline(cin, line)) throw runtime_error("Input closed");
    options.outputPath = line.empty() ? defaultOutputPath(options.inputPath) : cleanPath(line);

    cout << "    Payload path (empty to skip): ";
    if (!getline(cin, line)) throw runtime_error("Input closed");
    options.payloadPath = cleanPath(line);

    cout << "    Show original and reconstruction side by side? [y/n]: ";
    if (!getline(cin, line)) throw runtime_error("Input closed");
    options.view = !line.empty() && tolower(line[0]) == 'y';
}

string formatDouble(double value, int precision = 2) {
    stringstream ss;
    ss << fixed << setprecision(precision) << value;
    return ss.str();
}

string formatCutoffs(const Cutoffs& cutoffs) {
    return to_string(cutoffs.luma) + " / " + to_string(cutoffs.cb) + " / " + to_string(cutoffs.cr);
}

int runEncode(const CodecOptions& options, CodecInterface& ui) {
    string errorMessage;

    ui.showSectionHeader("ENCODING");
    ui.showInfo("Loading " + options.inputPath);
    Mat image = loadRgbImage(options.inputPath);
    ui.showInfo("Image dimensions: " + to_string(image.cols) + "x" + to_string(image.rows) + " pixels");

    auto start = chrono::high_resolution_clock::now();

    ChannelPipeline pipeline(image, !options.quiet);
    ui.showProgressBar(1, 3);

    Cutoffs cutoffs = options.cutoffs;
    if (options.targetCompressionPct > 0.0) {
        cutoffs = pipeline.cutoffsForTarget(options.targetCompressionPct);
    }

    Mat reconstructed = pipeline.reconstructImage(cutoffs);
    ui.showProgressBar(2, 3);

    vector<uint8_t> payload = pipeline.serialize(cutoffs);
    ui.showProgressBar(3, 3);

    auto end = chrono::high_resolution_clock::now();
    double execTime = chrono::duration<double, milli>(end - start).count();

    if (!validateAndCreateDirectory(options.outputPath, errorMessage)) {
        ui.showError(errorMessage);
        return 1;
    }
    if (!saveRgbImage(options.outputPath, reconstructed)) {
        ui.showError("Failed to save reconstructed image to " + options.outputPath);
        return 1;
    }
    ui.showSuccess("Reconstructed image saved to " + options.outputPath);

    if (!options.payloadPath.empty()) {
        if (!validateAndCreateDirectory(options.payloadPath, errorMessage)) {
            ui.showError(errorMessage);
            return 1;
        }
        writePayload(options.payloadPath, payload);
        ui.showSuccess("Payload saved to " + options.payloadPath);
    }

    if (!options.overlayPath.empty()) {
        Mat overlay = pipeline.drawRegionOverlay(reconstructed, cutoffs.luma);
        if (!validateAndCreateDirectory(options.overlayPath, errorMessage) ||
            !saveRgbImage(options.overlayPath, overlay)) {
            ui.showWarning("Failed to save region overlay to " + options.overlayPath);
        } else {
            ui.showSuccess("Region overlay saved to " + options.overlayPath);
        }
    }

    const RegionTree& luma = pipeline.getTree(Channel::LUMA);
    size_t rawSize = static_cast<size_t>(3) * image.rows * image.cols;

    vector<pair<string, string>> resultData = {
        {"Execution time", formatDouble(execTime) + " ms"},
        {"Cutoffs (Y / Cb / Cr)", formatCutoffs(cutoffs)},
        {"Raw size", to_string(rawSize) + " bytes"},
        {"Payload size", to_string(payload.size()) + " bytes"},
        {"Compression", formatDouble(pipeline.compressionPercentage(cutoffs)) + "%"},
        {"PSNR", formatDouble(calculatePSNR(image, reconstructed)) + " dB"},
        {"Mean absolute deviation", formatDouble(calculateMAD(image, reconstructed))},
        {"Max pixel difference", formatDouble(calculateMaxPixelDiff(image, reconstructed), 0)},
        {"Region tree depth", to_string(luma.getTreeDepth())},
        {"Region tree nodes", to_string(luma.getNodeCount())},
        {"Collapsed luma regions", to_string(luma.countCollapsed(cutoffs.luma))}
    };
    ui.showResultTable("ENCODING RESULT", resultData);

    if (options.view) {
        Mat originalBgr, reconstructedBgr;
        cvtColor(image, originalBgr, COLOR_RGB2BGR);
        cvtColor(reconstructed, reconstructedBgr, COLOR_RGB2BGR);

        namedWindow("Original", WINDOW_NORMAL);
        imshow("Original", originalBgr);
        namedWindow("Reconstructed", WINDOW_NORMAL);
        imshow("Reconstructed", reconstructedBgr);

        ui.showInfo("Press any key in an image window to close it.");
        waitKey(0);
        destroyAllWindows();
    }

    return 0;
}

int runDecode(const CodecOptions& options, CodecInterface& ui) {
    string errorMessage;

    ui.showSectionHeader("DECODING");
    vector<uint8_t> payload = readPayload(options.payloadPath);
    ui.showInfo("Payload: " + to_string(payload.size()) + " bytes, rank " + to_string(options.rank));

    Mat image = ChannelPipeline::decodePayload(payload, options.rank);

    if (!validateAndCreateDirectory(options.outputPath, errorMessage)) {
        ui.showError(errorMessage);
        return 1;
    }
    if (!saveRgbImage(options.outputPath, image)) {
        ui.showError("Failed to save decoded image to " + options.outputPath);
        return 1;
    }
    ui.showSuccess("Decoded image saved to " + options.outputPath);
    return 0;
}

int main(int argc, char* argv[]) {
    CodecOptions options;
    string errorMessage;

    if (argc > 1) {
        if (!parseArguments(argc, argv, options, errorMessage)) {
            CodecInterface ui;
            ui.showError(errorMessage);
            printUsage();
            return 2;
        }
    }

    CodecInterface ui(options.quiet);
    ui.showBanner();

    try {
        if (argc <= 1) {
            promptOptions(options, ui);
        }

        if (options.mode == CodecMode::DECODE) {
            return runDecode(options, ui);
        }
        return runEncode(options, ui);
    } catch (const CodecError& e) {
        ui.showError(e.what());
        return 1;
    } catch (const exception& e) {
        ui.showError(string("Unexpected failure: ") + e.what());
        return 1;
    }
}
