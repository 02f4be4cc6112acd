#include "NavigationTypes.h"

QString navigationPhaseName(NavigationPhase phase)
{
    switch (phase) {
        case NavigationPhase::Idle:       return QStringLiteral("Idle");
        case NavigationPhase::Requested:  return QStringLiteral("Requested");
        case NavigationPhase::Executing:  return QStringLiteral("Executing");
        case NavigationPhase::Verifying:  return QStringLiteral("Verifying");
        case NavigationPhase::Retrying:   return QStringLiteral("Retrying");
        case NavigationPhase::Completed:  return QStringLiteral("Completed");
        case NavigationPhase::Failed:     return QStringLiteral("Failed");
    }
    return QString();
}

QString scrollFailureReasonName(ScrollFailureReason reason)
{
    switch (reason) {
        case ScrollFailureReason::None:               return QStringLiteral("none");
        case ScrollFailureReason::TargetNotFound:     return QStringLiteral("target not found");
        case ScrollFailureReason::ContainerNotFound:  return QStringLiteral("container not found");
        case ScrollFailureReason::VerificationFailed: return QStringLiteral("target not visible after scroll");
        case ScrollFailureReason::AttemptsExhausted:  return QStringLiteral("attempts exhausted");
    }
    return QString();
}

void registerNavigationMetaTypes()
{
    qRegisterMetaType<ScrollRequest>("ScrollRequest");
    qRegisterMetaType<NavigationPhase>("NavigationPhase");
    qRegisterMetaType<ScrollFailureReason>("ScrollFailureReason");
    qRegisterMetaType<PageChangedEvent>("PageChangedEvent");
    qRegisterMetaType<RenderCompleteEvent>("RenderCompleteEvent");
    qRegisterMetaType<ScrollFailedEvent>("ScrollFailedEvent");
    qRegisterMetaType<VisibilityChangedEvent>("VisibilityChangedEvent");
}
