#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(dqCore, "docquery.core")
Q_LOGGING_CATEGORY(dqIndex, "docquery.index")
Q_LOGGING_CATEGORY(dqEmbedding, "docquery.embedding")
Q_LOGGING_CATEGORY(dqExtraction, "docquery.extraction")
Q_LOGGING_CATEGORY(dqRanking, "docquery.ranking")
Q_LOGGING_CATEGORY(dqGeneration, "docquery.generation")
