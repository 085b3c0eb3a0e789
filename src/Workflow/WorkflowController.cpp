#include <MiProbe/Workflow/WorkflowController.h>
#include <MiProbe/Core/Exception.h>
#include <MiProbe/Platform/Log.h>

#include <algorithm>

namespace Mi::Probe {

using Platform::Log;

// =============================================================================
// States
// =============================================================================

const char* StateName(WorkflowState state) {
    switch (state) {
        case WorkflowState::Initial:   return "Initial";
        case WorkflowState::Editing:   return "Editing";
        case WorkflowState::Marking:   return "Marking";
        case WorkflowState::Measuring: return "Measuring";
        case WorkflowState::Comparing: return "Comparing";
    }
    return "Unknown";
}

const char* StateDescription(WorkflowState state) {
    switch (state) {
        case WorkflowState::Initial:   return "No project open";
        case WorkflowState::Editing:   return "Editing project data";
        case WorkflowState::Marking:   return "Marking measurement points on the image";
        case WorkflowState::Measuring: return "Acquiring readings from the meter";
        case WorkflowState::Comparing: return "Comparing reference and test readings";
    }
    return "";
}

double MeasurementProgress::Percent(MeasurementRole role) const {
    if (totalPoints == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(Acquired(role)) / static_cast<double>(totalPoints);
}

// =============================================================================
// Construction
// =============================================================================

WorkflowController::WorkflowController(SessionContext& context)
    : context_(context) {}

WorkflowController::~WorkflowController() {
    ShutdownAcquisition();
}

// =============================================================================
// State
// =============================================================================

WorkflowState WorkflowController::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool WorkflowController::HasProject() const {
    return project_ != nullptr;
}

const Project& WorkflowController::GetProject() const {
    RequireProject("GetProject");
    return *project_;
}

std::vector<WorkflowState> WorkflowController::AvailableTransitions() const {
    switch (State()) {
        case WorkflowState::Initial:
            return {WorkflowState::Editing};
        case WorkflowState::Editing:
            return {WorkflowState::Marking, WorkflowState::Initial};
        case WorkflowState::Marking:
            return {WorkflowState::Measuring, WorkflowState::Initial};
        case WorkflowState::Measuring:
            return {WorkflowState::Comparing, WorkflowState::Initial};
        case WorkflowState::Comparing:
            return {WorkflowState::Editing, WorkflowState::Initial};
    }
    return {};
}

std::vector<StateTransition> WorkflowController::History() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<StateTransition>(history_.begin(), history_.end());
}

size_t WorkflowController::AddStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void WorkflowController::RemoveStateListener(size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

// =============================================================================
// Project lifecycle
// =============================================================================

void WorkflowController::CreateProject(const std::string& name, BoardImage image) {
    RequireState({WorkflowState::Initial}, "CreateProject");

    auto project = std::make_unique<Project>(name, std::move(image));
    project->SetTolerancePercent(context_.GetSettings().defaultTolerancePercent);

    project_ = std::move(project);
    Transition(WorkflowState::Editing, "CreateProject");
}

void WorkflowController::LoadProject(const std::string& path) {
    RequireState({WorkflowState::Initial}, "LoadProject");

    project_ = std::make_unique<Project>(Persistence::LoadProject(path));
    Transition(WorkflowState::Editing, "LoadProject");
}

void WorkflowController::SaveProject(const std::string& path,
                                     const Persistence::SaveOptions& options) const {
    RequireProject("SaveProject");
    Persistence::SaveProject(*project_, path, options);
}

void WorkflowController::CloseProject() {
    if (State() == WorkflowState::Initial && !project_) {
        return;
    }

    ShutdownAcquisition();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report_.reset();
        acquiredReference_.clear();
        acquiredTest_.clear();
    }
    project_.reset();

    Transition(WorkflowState::Initial, "CloseProject");
}

// =============================================================================
// Transitions
// =============================================================================

void WorkflowController::EnterMarking() {
    RequireState({WorkflowState::Editing}, "EnterMarking");
    Transition(WorkflowState::Marking, "EnterMarking");
}

void WorkflowController::StartMeasurement() {
    RequireState({WorkflowState::Marking}, "StartMeasurement");
    if (project_->PointCount() == 0) {
        throw StateException("StartMeasurement: project has no points");
    }

    if (!acquisition_) {
        acquisition_ = std::make_unique<AcquisitionProtocol>(
            context_.OpenChannel(), context_.GetSettings().acquisition);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        acquiredReference_.clear();
        acquiredTest_.clear();
    }
    Transition(WorkflowState::Measuring, "StartMeasurement");
}

void WorkflowController::EnterComparison() {
    RequireState({WorkflowState::Measuring}, "EnterComparison");

    if (acquisition_ && acquisition_->IsBusy()) {
        throw StateException("EnterComparison: " + std::to_string(acquisition_->Pending()) +
                             " acquisitions still pending");
    }

    ProjectData data = project_->Snapshot();
    size_t missing = std::count_if(data.points.begin(), data.points.end(),
                                   [](const Point& p) { return !p.IsMeasured(); });
    if (missing > 0) {
        throw StateException("EnterComparison: " + std::to_string(missing) + " of " +
                             std::to_string(data.points.size()) +
                             " points lack a reference or test reading");
    }

    auto report = std::make_shared<const Comparison::ComparisonReport>(
        Comparison::Compute(data, context_.GetSettings().comparison));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report_ = report;
        reportRevision_ = project_->Revision();
    }

    Log::Info("Comparison: " + std::to_string(report->okCount) + " ok, " +
              std::to_string(report->divergentCount) + " divergent, " +
              (report->overallPass ? "PASS" : "FAIL"));
    Transition(WorkflowState::Comparing, "EnterComparison");
}

void WorkflowController::RequestEdit() {
    RequireState({WorkflowState::Comparing}, "RequestEdit");
    InvalidateReport();
    Transition(WorkflowState::Editing, "RequestEdit");
}

// =============================================================================
// Point editing
// =============================================================================

int32_t WorkflowController::AddPoint(const Point& point) {
    RequireState({WorkflowState::Editing, WorkflowState::Marking}, "AddPoint");
    int32_t id = project_->AddPoint(point);
    InvalidateReport();
    Log::Debug("Added point #" + std::to_string(id));
    return id;
}

void WorkflowController::RemovePoint(int32_t id) {
    RequireState({WorkflowState::Editing, WorkflowState::Marking}, "RemovePoint");
    project_->RemovePoint(id);
    InvalidateReport();
    Log::Debug("Removed point #" + std::to_string(id));
}

void WorkflowController::MovePoint(int32_t id, int32_t x, int32_t y) {
    RequireState({WorkflowState::Editing, WorkflowState::Marking}, "MovePoint");
    Point geometry = project_->GetPoint(id);
    geometry.x = x;
    geometry.y = y;
    project_->SetPointGeometry(id, geometry);
    InvalidateReport();
}

void WorkflowController::ResizePoint(int32_t id, const Point& geometry) {
    RequireState({WorkflowState::Editing, WorkflowState::Marking}, "ResizePoint");
    Point current = project_->GetPoint(id);
    current.shape = geometry.shape;
    current.radius = geometry.radius;
    current.width = geometry.width;
    current.height = geometry.height;
    project_->SetPointGeometry(id, current);
    InvalidateReport();
}

void WorkflowController::SetPointInfo(int32_t id, const Point& info) {
    RequireState({WorkflowState::Editing, WorkflowState::Marking}, "SetPointInfo");
    project_->SetPointInfo(id, info);
    InvalidateReport();
}

void WorkflowController::ClearPoints() {
    RequireState({WorkflowState::Editing, WorkflowState::Marking}, "ClearPoints");
    project_->ClearPoints();
    InvalidateReport();
    Log::Debug("Cleared all points");
}

// =============================================================================
// Project editing
// =============================================================================

void WorkflowController::SetTolerance(double tolerancePercent) {
    RequireState({WorkflowState::Editing, WorkflowState::Marking, WorkflowState::Comparing},
                 "SetTolerance");
    project_->SetTolerancePercent(tolerancePercent);
    InvalidateReport();
}

void WorkflowController::SetProjectInfo(const ProjectInfo& info) {
    RequireProject("SetProjectInfo");
    project_->SetInfo(info);
}

// =============================================================================
// Measurement
// =============================================================================

std::future<Reading> WorkflowController::AcquirePoint(int32_t id, MeasurementRole role) {
    RequireState({WorkflowState::Measuring}, "AcquirePoint");
    return acquisition_->Submit(*project_, id, role,
                                [this](const Reading& reading) { OnReadingStored(reading); });
}

std::vector<std::future<Reading>> WorkflowController::AcquireAll(MeasurementRole role) {
    RequireState({WorkflowState::Measuring}, "AcquireAll");

    uint64_t generation = cancelGeneration_.load();
    std::vector<std::future<Reading>> futures;
    for (int32_t id : project_->PointIds()) {
        if (cancelGeneration_.load() != generation) {
            Log::Info("AcquireAll: stopped after cancel");
            break;
        }
        futures.push_back(AcquirePoint(id, role));
    }
    return futures;
}

void WorkflowController::RecordReading(int32_t id, MeasurementRole role, double value,
                                       const std::string& unit) {
    RequireState({WorkflowState::Measuring}, "RecordReading");

    Reading reading;
    reading.pointId = id;
    reading.role = role;
    reading.value = value;
    reading.unit = unit;
    reading.timestamp = Now();
    project_->SetMeasurement(id, role, value, unit, reading.timestamp);
    OnReadingStored(reading);
}

void WorkflowController::CancelAcquisition() {
    ++cancelGeneration_;
    if (acquisition_) {
        acquisition_->Cancel();
        Log::Info("Acquisition cancel requested");
    }
}

void WorkflowController::WaitForAcquisitions() {
    if (acquisition_) {
        acquisition_->WaitIdle();
    }
}

MeasurementProgress WorkflowController::Progress() const {
    MeasurementProgress progress;
    progress.totalPoints = project_ ? project_->PointCount() : 0;

    std::lock_guard<std::mutex> lock(mutex_);
    progress.referenceAcquired = acquiredReference_.size();
    progress.testAcquired = acquiredTest_.size();
    return progress;
}

// =============================================================================
// Comparison
// =============================================================================

Comparison::ComparisonReportPtr WorkflowController::Report() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!project_) {
        return nullptr;
    }

    uint64_t revision = project_->Revision();
    bool stale = !report_ || reportRevision_ != revision;

    if (stale && state_ == WorkflowState::Comparing) {
        ProjectData data = project_->Snapshot();
        report_ = std::make_shared<const Comparison::ComparisonReport>(
            Comparison::Compute(data, context_.GetSettings().comparison));
        reportRevision_ = revision;
        Log::Debug("Comparison report recomputed");
        return report_;
    }
    return stale ? nullptr : report_;
}

// =============================================================================
// Internal
// =============================================================================

void WorkflowController::RequireState(std::initializer_list<WorkflowState> allowed,
                                      const char* operation) const {
    WorkflowState current = State();
    if (std::find(allowed.begin(), allowed.end(), current) == allowed.end()) {
        throw StateException(std::string(operation) + " is not allowed in state " +
                             StateName(current));
    }
}

void WorkflowController::RequireProject(const char* operation) const {
    if (!project_) {
        throw StateException(std::string(operation) + ": no project is open");
    }
}

void WorkflowController::Transition(WorkflowState to, const std::string& trigger) {
    WorkflowState from;
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        state_ = to;

        history_.push_back({from, to, Now(), trigger});
        while (history_.size() > MAX_STATE_HISTORY) {
            history_.pop_front();
        }

        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    Log::Info(std::string("State ") + StateName(from) + " -> " + StateName(to) +
              " (" + trigger + ")");

    for (const auto& listener : listeners) {
        listener(from, to);
    }
}

void WorkflowController::InvalidateReport() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.reset();
}

void WorkflowController::OnReadingStored(const Reading& reading) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reading.role == MeasurementRole::Reference) {
        acquiredReference_.insert(reading.pointId);
    } else {
        acquiredTest_.insert(reading.pointId);
    }
}

void WorkflowController::ShutdownAcquisition() {
    if (!acquisition_) {
        return;
    }
    acquisition_->Cancel();
    acquisition_->WaitIdle();
    acquisition_.reset();
}

} // namespace Mi::Probe
