/**
 * @file session_demo.cpp
 * @brief Example: full inspection session against a simulated meter
 *
 * Usage: miprobe_session_demo [settings.conf] [output.mip]
 */

#include <MiProbe/MiProbe.h>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

using namespace Mi::Probe;

namespace {

// Synthetic board photo: dark green with copper pads
BoardImage MakeBoardImage(int32_t width, int32_t height) {
    BoardImage image(width, height, 3);
    for (int32_t y = 0; y < height; ++y) {
        uint8_t* row = image.RowPtr(y);
        for (int32_t x = 0; x < width; ++x) {
            bool pad = (x / 40 + y / 40) % 5 == 0;
            row[x * 3 + 0] = pad ? 184 : 20;
            row[x * 3 + 1] = pad ? 115 : 90;
            row[x * 3 + 2] = pad ? 51 : 40;
        }
    }
    return image;
}

void PrintProgress(const WorkflowController& controller) {
    MeasurementProgress progress = controller.Progress();
    printf("   Progress: reference %zu/%zu (%.0f%%), test %zu/%zu (%.0f%%)\n",
           progress.referenceAcquired, progress.totalPoints,
           progress.Percent(MeasurementRole::Reference),
           progress.testAcquired, progress.totalPoints,
           progress.Percent(MeasurementRole::Test));
}

// Wait for every future; failures are reported and leave the point unmeasured
size_t Collect(std::vector<std::future<Reading>>& futures) {
    size_t failed = 0;
    for (auto& future : futures) {
        try {
            Reading reading = future.get();
            printf("   #%d %-9s %8.3f %s (attempts %d)\n", reading.pointId,
                   RoleName(reading.role), reading.value, reading.unit.c_str(),
                   reading.attempts);
        } catch (const AcquisitionException& e) {
            printf("   %s\n", e.what());
            ++failed;
        }
    }
    return failed;
}

} // namespace

int main(int argc, char** argv) {
    printf("=== MiProbe Sample: Inspection Session (v%s) ===\n\n", GetVersion());

    try {
        Settings settings;
        if (argc > 1) {
            settings = LoadSettings(argv[1]);
        }
        std::string outputPath = argc > 2 ? argv[2] : "session_demo.mip";
        Platform::Log::SetLevel(settings.logLevel);

        // The simulated meter replaces the serial device
        Serial::SimulatedMeter* meter = nullptr;
        SessionContext context(settings, [&meter](const Serial::SerialConfig&) {
            auto simulated = std::make_unique<Serial::SimulatedMeter>(
                Serial::SimulatedMeterParams().SetSeed(7).SetResponseDelayMs(5));
            meter = simulated.get();
            return std::unique_ptr<Serial::SerialChannel>(std::move(simulated));
        });
        WorkflowController controller(context);

        // 1. Project
        printf("1. Creating project...\n");
        controller.CreateProject("Power supply rev B", MakeBoardImage(640, 480));
        ProjectInfo info = controller.GetProject().Info();
        info.boardModel = "PSU-200";
        info.description = "Golden sample vs returned unit";
        controller.SetProjectInfo(info);
        printf("   %s (%s), tolerance %.2f%%\n", info.name.c_str(), info.boardModel.c_str(),
               controller.GetProject().TolerancePercent());

        // 2. Points
        printf("\n2. Marking points...\n");
        controller.EnterMarking();
        const char* names[] = {"R12", "C3", "U1 VCC", "D4", "TP7"};
        for (int32_t i = 0; i < 5; ++i) {
            Point point = i % 2 == 0 ? Point::MakeCircle(80 + i * 110, 120 + i * 50)
                                     : Point::MakeRectangle(80 + i * 110, 120 + i * 50, 30, 16);
            int32_t id = controller.AddPoint(point);
            Point pointInfo;
            pointInfo.name = names[i];
            controller.SetPointInfo(id, pointInfo);
            Point stored = controller.GetProject().GetPoint(id);
            printf("   %s at (%d, %d) %s\n", stored.DisplayName().c_str(), stored.x, stored.y,
                   stored.SizeText().c_str());
        }

        // 3. Measurement
        printf("\n3. Measuring reference board...\n");
        controller.StartMeasurement();
        auto reference = controller.AcquireAll(MeasurementRole::Reference);
        size_t failed = Collect(reference);
        PrintProgress(controller);

        printf("\n4. Measuring test board...\n");
        std::vector<int32_t> ids = controller.GetProject().PointIds();
        meter->SetOffset(ids[2], 0.9);
        meter->InjectFault(Serial::SimulatedFault::BadChecksum);
        auto test = controller.AcquireAll(MeasurementRole::Test);
        failed += Collect(test);
        controller.WaitForAcquisitions();
        PrintProgress(controller);

        if (failed > 0) {
            printf("   %zu acquisitions failed, entering remaining values by hand\n", failed);
            for (int32_t id : ids) {
                Point point = controller.GetProject().GetPoint(id);
                if (!point.HasReference()) {
                    controller.RecordReading(id, MeasurementRole::Reference, 10.0, "V");
                }
                if (!point.HasCompare()) {
                    controller.RecordReading(id, MeasurementRole::Test, 10.0, "V");
                }
            }
        }

        // 5. Comparison
        printf("\n5. Comparing...\n");
        controller.EnterComparison();
        Comparison::ComparisonReportPtr report = controller.Report();
        printf("%s\n", Comparison::FormatReport(*report).c_str());

        Comparison::ComparisonSummary summary = Comparison::Summarize(*report);
        printf("   Pass rate: %.1f%% of %zu measured points\n", summary.passRatePercent,
               summary.measuredPoints);

        controller.SetTolerance(10.0);
        printf("   At 10%% tolerance: %zu divergent, %s\n", controller.Report()->divergentCount,
               controller.Report()->overallPass ? "PASS" : "FAIL");

        // 6. Save
        printf("\n6. Saving to '%s'...\n", outputPath.c_str());
        controller.SaveProject(outputPath);
        Persistence::ProjectFileInfo fileInfo = Persistence::ReadProjectInfo(outputPath);
        printf("   %zu points, schema %u\n", fileInfo.pointCount,
               static_cast<unsigned>(fileInfo.schemaVersion));
        Persistence::ExportText(outputPath, outputPath + ".json");
        printf("   Exported '%s.json'\n", outputPath.c_str());

        controller.CloseProject();
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    printf("\n=== Done ===\n");
    return 0;
}
