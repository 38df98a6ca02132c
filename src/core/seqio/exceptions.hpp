#ifndef SEQIO_EXCEPTIONS_H
#define SEQIO_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace seqio {

/** An annotation line (chrom.sizes, cytobandIdeo) could not be parsed. */
class MalformedAnnotationLine : public std::runtime_error
{
public:
  MalformedAnnotationLine (
    const std::string& filename,
    unsigned long line_no,
    const std::string& reason
  );

  const std::string& getFilename() const { return m_filename; }
  unsigned long getLineNo() const { return m_line_no; }

private:
  std::string m_filename;
  unsigned long m_line_no;
};

/** An interval dataset file could not be read. */
class DatasetReadError : public std::runtime_error
{
public:
  explicit DatasetReadError(const std::string& filename);

  const std::string& getFilename() const { return m_filename; }

private:
  std::string m_filename;
};

} // namespace seqio

#endif // SEQIO_EXCEPTIONS_H
