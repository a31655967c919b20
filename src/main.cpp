#include <Bubble/Bubble.hpp>
#include <DiagnosticsLogger/DiagnosticsLogger.hpp>
#include <SensorManager/SensorManager.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace bubble;

int main()
{
    time::VirtualClock clock;

    // Device rolls slowly from flat onto its right edge and back over.
    sensors::TiltProfile profile;
    profile.initialPitch = 0.0f;
    profile.initialRoll = 0.0f;
    profile.rollRateRadSec = 0.6f;

    sensors::SensorConfig sensorCfg;
    sensorCfg.accelNoiseSigma = 0.05f;
    sensorCfg.magNoiseSigma = 0.5f;

    sensors::SensorManager sensorManager(clock, sensorCfg, profile);

    logging::LoggerConfig logCfg;
    logCfg.outputPath = "bubble_diagnostics.log";
    auto logger = std::make_shared<logging::DiagnosticsLogger>(logCfg);

    BubbleSettings settings;
    settings.sampleSize = 20;
    settings.samplingPeriod = std::chrono::microseconds(5000);
    settings.timingWindow = 200;
    settings.emission = fusion::EmissionPolicy::OnChange;

    Bubble detector(settings, logger);

    logger->start();

    auto stream = detector.registerObserver(sensorManager);
    logger->attach(*stream);
    stream->subscribe(
        [](const BubbleEvent &e)
        {
            std::cout << "orientation=" << toString(e.orientation)
                      << " pitch=" << e.coordinates.pitch
                      << " roll=" << e.coordinates.roll << "\n";
        },
        []
        { std::cout << "stream completed\n"; });

    sensorManager.start();

    std::this_thread::sleep_for(std::chrono::seconds(10));

    sensorManager.stop();
    detector.unregister();
    logger->stop();
}
