#pragma once

#include "seqbatch/Batch.hh"
#include "seqbatch/Batcher.hh"
#include "seqbatch/Cache.hh"
#include "seqbatch/Error.hh"
#include "seqbatch/FlatFileStore.hh"
#include "seqbatch/IndexedStore.hh"
#include "seqbatch/Io.hh"
#include "seqbatch/Preprocessor.hh"
#include "seqbatch/Store.hh"
#include "seqbatch/Tensor.hh"
#include "seqbatch/TensorOps.hh"
#include "seqbatch/Types.hh"
#include "seqbatch/Utils.hh"
#include "seqbatch/Vocabulary.hh"
