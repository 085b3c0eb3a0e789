#pragma once

/**
 * @file WorkflowController.h
 * @brief Edit -> mark -> measure -> compare state machine
 *
 * Transitions:
 *   Initial   -> Editing     CreateProject / LoadProject
 *   Editing   -> Marking     EnterMarking
 *   Marking   -> Measuring   StartMeasurement (at least one point)
 *   Measuring -> Comparing   EnterComparison (every point has both readings)
 *   Comparing -> Editing     RequestEdit
 *   any       -> Initial     CloseProject
 *
 * Anything else throws StateException and leaves the controller unchanged.
 *
 * Operation availability:
 *   points (add/remove/move/resize/info/clear)   Editing, Marking
 *   SetTolerance                                 Editing, Marking, Comparing
 *   SetProjectInfo                               any state with a project
 *   AcquirePoint / AcquireAll / RecordReading    Measuring
 *   SaveProject                                  any state with a project
 *
 * The controller is driven from one control thread. Acquisitions run on the
 * acquisition worker and report progress back through a callback.
 */

#include <MiProbe/Acquisition/Acquisition.h>
#include <MiProbe/Comparison/Comparison.h>
#include <MiProbe/Core/Export.h>
#include <MiProbe/Core/Types.h>
#include <MiProbe/Model/Project.h>
#include <MiProbe/Persistence/ProjectCodec.h>
#include <MiProbe/Workflow/SessionContext.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Mi::Probe {

// =============================================================================
// States
// =============================================================================

enum class WorkflowState {
    Initial,        ///< No project
    Editing,        ///< Project metadata and points editable
    Marking,        ///< Placing points on the image
    Measuring,      ///< Acquiring readings
    Comparing       ///< Report available
};

/// "Initial", "Editing", ...
MIPROBE_API const char* StateName(WorkflowState state);

/// One-line description for status displays
MIPROBE_API const char* StateDescription(WorkflowState state);

/// Maximum transitions kept in History()
constexpr size_t MAX_STATE_HISTORY = 50;

struct MIPROBE_API StateTransition {
    WorkflowState from = WorkflowState::Initial;
    WorkflowState to = WorkflowState::Initial;
    Timestamp timestamp{};
    std::string trigger;        ///< Operation that caused it
};

/**
 * @brief Points acquired per role since entering Measuring
 */
struct MIPROBE_API MeasurementProgress {
    size_t totalPoints = 0;
    size_t referenceAcquired = 0;
    size_t testAcquired = 0;

    size_t Acquired(MeasurementRole role) const {
        return role == MeasurementRole::Reference ? referenceAcquired : testAcquired;
    }

    /// Percent of points acquired in role (0 when there are no points)
    double Percent(MeasurementRole role) const;
};

/// Called after a transition is committed
using StateListener = std::function<void(WorkflowState from, WorkflowState to)>;

// =============================================================================
// WorkflowController
// =============================================================================

class MIPROBE_API WorkflowController {
public:
    /// context must outlive the controller
    explicit WorkflowController(SessionContext& context);

    /// Cancels acquisitions and closes the project
    ~WorkflowController();

    WorkflowController(const WorkflowController&) = delete;
    WorkflowController& operator=(const WorkflowController&) = delete;

    // =========================================================================
    // State
    // =========================================================================

    WorkflowState State() const;
    bool HasProject() const;

    /**
     * @brief Current project (read access; mutate through the controller)
     * @throws StateException if no project is open
     */
    const Project& GetProject() const;

    /// Transitions legal from the current state
    std::vector<WorkflowState> AvailableTransitions() const;

    /// Most recent transitions, oldest first
    std::vector<StateTransition> History() const;

    /// @return Id for RemoveStateListener
    size_t AddStateListener(StateListener listener);
    void RemoveStateListener(size_t id);

    // =========================================================================
    // Project lifecycle
    // =========================================================================

    /**
     * @brief Initial -> Editing with a new project
     * @throws StateException, ValidationException
     */
    void CreateProject(const std::string& name, BoardImage image);

    /**
     * @brief Initial -> Editing with a project read from path
     * @throws StateException, IOException, FormatException, CorruptContainerException
     */
    void LoadProject(const std::string& path);

    /**
     * @brief Save the current project (any state)
     * @throws StateException if no project, IOException on write failure
     */
    void SaveProject(const std::string& path,
                     const Persistence::SaveOptions& options = Persistence::SaveOptions()) const;

    /// any -> Initial; cancels and drains acquisitions first
    void CloseProject();

    // =========================================================================
    // Transitions
    // =========================================================================

    void EnterMarking();

    /**
     * @brief Marking -> Measuring
     *
     * Resets progress counters (readings are kept) and opens the meter
     * channel on first use.
     *
     * @throws StateException without points, IOException if the channel fails
     */
    void StartMeasurement();

    /**
     * @brief Measuring -> Comparing, computes and caches the report
     * @throws StateException if acquisitions are pending or readings missing
     */
    void EnterComparison();

    /// Comparing -> Editing, drops the report
    void RequestEdit();

    // =========================================================================
    // Point editing (Editing, Marking)
    // =========================================================================

    /// @return Assigned id
    int32_t AddPoint(const Point& point);
    void RemovePoint(int32_t id);
    void MovePoint(int32_t id, int32_t x, int32_t y);

    /// Take shape and size from geometry; position is kept
    void ResizePoint(int32_t id, const Point& geometry);

    /// Take name, description, componentType and expectedValue from info
    void SetPointInfo(int32_t id, const Point& info);

    void ClearPoints();

    // =========================================================================
    // Project editing
    // =========================================================================

    /// Editing, Marking or Comparing
    void SetTolerance(double tolerancePercent);

    void SetProjectInfo(const ProjectInfo& info);

    // =========================================================================
    // Measurement (Measuring)
    // =========================================================================

    /**
     * @brief Queue acquisition of one point
     * @throws StateException outside Measuring, ValidationException for unknown id
     */
    std::future<Reading> AcquirePoint(int32_t id, MeasurementRole role);

    /**
     * @brief Queue every point in project order
     *
     * Stops submitting once CancelAcquisition() is called; futures already
     * returned report Cancelled.
     */
    std::vector<std::future<Reading>> AcquireAll(MeasurementRole role);

    /**
     * @brief Store a manually entered reading
     * @throws StateException outside Measuring, ValidationException
     */
    void RecordReading(int32_t id, MeasurementRole role, double value,
                       const std::string& unit = "");

    /// Cancel the in-flight and queued acquisitions
    void CancelAcquisition();

    /// Block until the acquisition worker is idle
    void WaitForAcquisitions();

    MeasurementProgress Progress() const;

    // =========================================================================
    // Comparison
    // =========================================================================

    /**
     * @brief Cached report
     *
     * In Comparing, a report invalidated by a later mutation is recomputed.
     * Elsewhere returns nullptr unless a still-valid report is cached.
     */
    Comparison::ComparisonReportPtr Report();

private:
    void RequireState(std::initializer_list<WorkflowState> allowed, const char* operation) const;
    void RequireProject(const char* operation) const;
    void Transition(WorkflowState to, const std::string& trigger);
    void InvalidateReport();
    void OnReadingStored(const Reading& reading);
    void ShutdownAcquisition();

    SessionContext& context_;

    mutable std::mutex mutex_;      // state, history, progress, report, listeners
    WorkflowState state_ = WorkflowState::Initial;
    std::deque<StateTransition> history_;
    std::map<size_t, StateListener> listeners_;
    size_t nextListenerId_ = 1;

    std::set<int32_t> acquiredReference_;
    std::set<int32_t> acquiredTest_;

    Comparison::ComparisonReportPtr report_;
    uint64_t reportRevision_ = 0;

    std::atomic<uint64_t> cancelGeneration_{0};

    std::unique_ptr<Project> project_;
    std::unique_ptr<AcquisitionProtocol> acquisition_;
};

} // namespace Mi::Probe
