#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <parallax/config/calibration_store.hpp>
#include <system_error>
#include <vector>

using parallax::config::CalibrationStore;
using parallax::core::CalibrationParams;

int main() {
    std::cout << "=== Testing calibration store ===" << std::endl;

    auto dir = std::filesystem::temp_directory_path() / "parallax_test_calibration";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    auto path = dir / "calibration.json";

    {
        CalibrationStore store(path);
        assert(store.get() == CalibrationParams{});

        std::vector<CalibrationParams> seen;
        auto id = store.subscribe(
            [&](const CalibrationParams &p) { seen.push_back(p); });

        auto invalid = std::make_error_code(std::errc::invalid_argument);
        CalibrationParams bad = store.get();
        bad.screen_width_cm = 0.0;
        assert(store.set(bad) == invalid);
        bad = store.get();
        bad.screen_height_cm = -4.0;
        assert(store.set(bad) == invalid);
        bad = store.get();
        bad.far = bad.near;
        assert(store.set(bad) == invalid);
        bad = store.get();
        bad.viewer_distance_cm = std::numeric_limits<double>::quiet_NaN();
        assert(store.set(bad) == invalid);
        assert(store.get() == CalibrationParams{} && "Rejected values kept out");
        assert(seen.empty());
        assert(!std::filesystem::exists(path));
        std::cout << "  ✓ invalid calibration rejected" << std::endl;

        CalibrationParams good{.screen_width_cm = 60.0,
                               .screen_height_cm = 34.0,
                               .viewer_distance_cm = 65.0,
                               .near = 0.1,
                               .far = 100.0};
        assert(!store.set(good));
        assert(store.get() == good);
        assert(seen.size() == 1 && seen.back() == good);
        assert(std::filesystem::exists(path));

        assert(!store.set(good));
        assert(seen.size() == 1 && "Unchanged value does not notify");

        assert(!store.modify([](CalibrationParams &p) {
            p.viewer_distance_cm += 1.0;
        }));
        assert(store.get().viewer_distance_cm == 66.0);
        assert(seen.size() == 2);

        assert(store.modify([](CalibrationParams &p) { p.near = 0.0; }) ==
               invalid);
        assert(store.get().near == 0.1);
        std::cout << "  ✓ valid changes applied and announced" << std::endl;

        store.unsubscribe(id);
        assert(!store.modify([](CalibrationParams &p) { p.far = 150.0; }));
        assert(seen.size() == 2);
    }

    {
        CalibrationStore store(path);
        auto loaded = store.load();
        assert(loaded);
        assert(loaded->screen_width_cm == 60.0);
        assert(loaded->viewer_distance_cm == 66.0);
        assert(loaded->far == 150.0);
        assert(store.get() == *loaded);

        int notified = 0;
        store.subscribe([&](const CalibrationParams &) { ++notified; });
        store.reset();
        assert(store.get() == CalibrationParams{});
        assert(notified == 1);

        CalibrationStore reread(path);
        assert(reread.load());
        assert(reread.get() == CalibrationParams{} && "reset() persists");
        std::cout << "  ✓ persisted and reloaded" << std::endl;
    }

    {
        CalibrationStore missing(dir / "does_not_exist.json");
        assert(!missing.load());
        assert(missing.get() == CalibrationParams{});

        auto broken = dir / "broken.json";
        std::ofstream(broken) << "{\"screen_width_cm\": ";
        CalibrationStore corrupt(broken);
        assert(!corrupt.load());

        auto negative = dir / "negative.json";
        std::ofstream(negative)
            << R"({"screen_width_cm":-1,"screen_height_cm":20,)"
               R"("viewer_distance_cm":60,"near":0.1,"far":200})";
        CalibrationStore rejected(negative);
        auto result = rejected.load();
        assert(!result);
        assert(result.error() == std::make_error_code(std::errc::invalid_argument));
        assert(rejected.get() == CalibrationParams{});
        std::cout << "  ✓ bad files leave defaults in place" << std::endl;
    }

    std::filesystem::remove_all(dir);
    std::cout << "\nAll calibration store tests passed" << std::endl;
    return 0;
}
