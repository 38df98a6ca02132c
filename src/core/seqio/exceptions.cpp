#include "exceptions.hpp"
#include <boost/format.hpp>

using namespace std;

namespace seqio {

MalformedAnnotationLine::MalformedAnnotationLine (
  const string& filename,
  unsigned long line_no,
  const string& reason
)
: runtime_error(str(boost::format("Malformed line %lu in annotation file '%s': %s") % line_no % filename % reason)),
  m_filename(filename),
  m_line_no(line_no)
{}

DatasetReadError::DatasetReadError(const string& filename)
: runtime_error(str(boost::format("Could not read dataset file '%s'") % filename)),
  m_filename(filename)
{}

} // namespace seqio
