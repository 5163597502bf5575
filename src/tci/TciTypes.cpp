/*
 * TciTypes.cpp
 *
 * String conversions for session enums
 * Part of SWL View
 */

#include "TciTypes.h"

QString profileToString(Profile profile)
{
    switch (profile) {
        case Profile::Thetis: return "thetis";
        case Profile::ExpertSunSDR: return "expert";
    }
    return "thetis";
}

Profile profileFromString(const QString& value, bool* ok)
{
    QString token = value.trimmed().toLower();
    if (ok) *ok = true;

    if (token == "thetis") {
        return Profile::Thetis;
    }
    if (token == "expert" || token == "expertsunsdr" || token == "expertsdr") {
        return Profile::ExpertSunSDR;
    }

    // Unknown profiles fall back to the confirmed dialect
    if (ok) *ok = false;
    return Profile::Thetis;
}

QString spotPolicyToString(SpotPolicy policy)
{
    return policy == SpotPolicy::Persistent ? "persistent" : "timed";
}

SpotPolicy spotPolicyFromString(const QString& value, bool* ok)
{
    QString token = value.trimmed().toLower();
    if (ok) *ok = (token == "timed" || token == "persistent");
    return token == "persistent" ? SpotPolicy::Persistent : SpotPolicy::Timed;
}

QString tciErrorToString(TciError error)
{
    switch (error) {
        case TciError::None: return "None";
        case TciError::ConnectionError: return "ConnectionError";
        case TciError::HandshakeError: return "HandshakeError";
        case TciError::NotConnectedError: return "NotConnectedError";
        case TciError::InvalidIntentError: return "InvalidIntentError";
    }
    return "Unknown";
}
