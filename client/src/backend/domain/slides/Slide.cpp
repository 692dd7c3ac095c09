#include "backend/domain/slides/Slide.h"

const char* const Slide::kNoDescription = "No description available";
const char* const Slide::kDescriptionNotAvailable = "Description not available";
const char* const Slide::kUnknownUser = "Unknown User";
const char* const Slide::kDirectPlay = "Direct Play";
const char* const Slide::kTranscoding = "Transcoding";
