#ifndef SEQIO_H
#define SEQIO_H

#include "seqio/AnnotationFile.hpp"
#include "seqio/BedFile.hpp"
#include "seqio/Chromosome.hpp"
#include "seqio/ChromosomeSet.hpp"
#include "seqio/Cytoband.hpp"
#include "seqio/Dataset.hpp"
#include "seqio/Interval.hpp"
#include "seqio/exceptions.hpp"
#include "seqio/types.hpp"

/** Handles genome annotation and interval files. */
namespace seqio {
}

#endif // SEQIO_H
