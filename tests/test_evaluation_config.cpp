/**
 * Evaluation Config Test
 *
 * Verifies defaults, file parsing and error reporting of the tool settings.
 *
 * Usage:
 *   build/bin/test_evaluation_config
 */

#include "config/EvaluationConfig.h"
#include <iostream>
#include <fstream>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

using namespace landmark_eval;

static bool throwsOnLoad(const std::string& path, const std::string& content) {
    {
        std::ofstream file(path);
        file << content;
    }
    try {
        EvaluationConfig::loadFromFile(path);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    char dir_template[] = "/tmp/landmark_eval_config_XXXXXX";
    if (mkdtemp(dir_template) == nullptr) {
        std::cerr << "Failed to create temporary folder" << std::endl;
        return 1;
    }
    std::string path = std::string(dir_template) + "/eval.cfg";

    // Test 1: Defaults
    std::cout << "\n--- Test 1: Defaults ---" << std::endl;
    {
        EvaluationConfig config;
        if (config.std_coef != 5.0 || config.use_affine || !config.equal_size ||
            config.scales != std::vector<int>({5, 10, 25, 50, 100})) {
            std::cerr << "  FAIL: Unexpected defaults" << std::endl;
            return 1;
        }
        std::cout << "  PASS: std_coef 5, raw errors, equal size" << std::endl;
    }

    // Test 2: Loading with comments and partial settings
    std::cout << "\n--- Test 2: Load file ---" << std::endl;
    {
        {
            std::ofstream file(path);
            file << "# annotation evaluation\n";
            file << "std_coef 3.5   # stricter\n";
            file << "\n";
            file << "use_affine true\n";
            file << "scales 10 50\n";
        }
        EvaluationConfig config = EvaluationConfig::loadFromFile(path);
        if (config.std_coef != 3.5 || !config.use_affine || !config.equal_size ||
            config.scales != std::vector<int>({10, 50})) {
            std::cerr << "  FAIL: Settings not applied" << std::endl;
            return 1;
        }
        std::cout << "  PASS: File settings applied, others kept" << std::endl;
    }

    // Test 3: Save and reload
    std::cout << "\n--- Test 3: Save / load ---" << std::endl;
    {
        EvaluationConfig config;
        config.std_coef = 2.0;
        config.equal_size = false;
        config.verbose = true;
        config.saveToFile(path);
        EvaluationConfig loaded = EvaluationConfig::loadFromFile(path);
        if (loaded.std_coef != 2.0 || loaded.equal_size || !loaded.verbose || loaded.scales != config.scales) {
            std::cerr << "  FAIL: Reloaded settings differ" << std::endl;
            return 1;
        }
        std::cout << "  PASS: Settings survive save and load" << std::endl;
    }

    // Test 4: Errors
    std::cout << "\n--- Test 4: Invalid files ---" << std::endl;
    {
        bool ok = throwsOnLoad(path, "unknown_key 1\n") &&
                  throwsOnLoad(path, "std_coef abc\n") &&
                  throwsOnLoad(path, "std_coef -1\n") &&
                  throwsOnLoad(path, "use_affine maybe\n") &&
                  throwsOnLoad(path, "scales 10 2.5\n") &&
                  throwsOnLoad(path, "std_coef 1 2\n");
        bool missing = false;
        try {
            EvaluationConfig::loadFromFile(std::string(dir_template) + "/missing.cfg");
        } catch (const std::runtime_error&) {
            missing = true;
        }
        if (!ok || !missing) {
            std::cerr << "  FAIL: Invalid config accepted" << std::endl;
            return 1;
        }
        std::cout << "  PASS: Invalid settings rejected" << std::endl;
    }

    // Test 5: Scales outside the int range
    std::cout << "\n--- Test 5: Scale range ---" << std::endl;
    {
        EvaluationConfig config;
        bool ok = throwsOnLoad(path, "scales 1e20\n") &&
                  throwsOnLoad(path, "scales 10 3000000000\n") &&
                  throwsOnLoad(path, "scales nan\n");
        bool set_thrown = false;
        try {
            config.set("scales", {"25", "-1e30"});
        } catch (const std::runtime_error&) {
            set_thrown = true;
        }
        if (!ok || !set_thrown || config.scales != std::vector<int>({5, 10, 25, 50, 100})) {
            std::cerr << "  FAIL: Out of range scale accepted" << std::endl;
            return 1;
        }
        std::cout << "  PASS: Out of range scales rejected" << std::endl;
    }

    std::remove(path.c_str());
    rmdir(dir_template);

    std::cout << "\n=== Evaluation Config Test ===" << std::endl;
    std::cout << "RESULT: PASS" << std::endl;
    return 0;
}
